#pragma once

// search engine
#include "engine/assembler.hpp"
#include "engine/exclusion_set.hpp"
#include "engine/fragment.hpp"
#include "engine/fragment_matcher.hpp"
#include "engine/result.hpp"
#include "engine/search.hpp"
#include "engine/types.hpp"

// utilities
#include "utils/file_utils.hpp"
#include "utils/pretty_landscape.hpp"
#include "utils/text_utils.hpp"
