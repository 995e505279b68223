#include "card_file.hpp"

#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "helpers/utilities.hpp"

void card_file::write_records(std::ostream& out, const cardgen::Batch& batch)
{
    for (const auto& record : batch)
        out << util::format_record(record) << '\n';
}

card_file::fs::path card_file::write_batch_file(const fs::path& directory, std::string_view bin,
                                                const cardgen::Batch& batch,
                                                std::chrono::system_clock::time_point when)
{
    if (!fs::is_directory(directory))
        fs::create_directories(directory);

    auto path = directory / util::batch_filename(bin, batch.size(), when);
    std::ofstream out(path, std::ios::trunc);
    if (!out)
        throw std::runtime_error("unable to open '" + path.string() + "' for writing");

    write_records(out, batch);
    out.flush();
    if (!out)
        throw std::runtime_error("failed writing cards to '" + path.string() + "'");

    spdlog::debug("Wrote {} card(s) to {}", batch.size(), path.string());
    return path;
}
