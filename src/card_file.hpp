#pragma once

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string_view>

#include "model.hpp"

namespace card_file
{
    namespace fs = std::filesystem;

    /**
     * Writes one `number|MM|YYYY|cvv` line per record, no header.
     */
    void write_records(std::ostream& out, const cardgen::Batch& batch);

    /**
     * Writes the batch to `<directory>/cards_<bin>_<count>_<timestamp>.txt`,
     * creating the directory if it doesn't exist yet.
     *
     * @return Path of the written file
     * @throws std::runtime_error If the file can't be opened or written
     */
    fs::path write_batch_file(const fs::path& directory, std::string_view bin, const cardgen::Batch& batch,
                              std::chrono::system_clock::time_point when);
}
