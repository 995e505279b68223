#pragma once

#include "attributes.hpp"
#include "bin.hpp"
#include "generation.hpp"
#include "luhn.hpp"
#include "model.hpp"
#include "random_source.hpp"
#include "scheme.hpp"
#include "synthesis.hpp"
