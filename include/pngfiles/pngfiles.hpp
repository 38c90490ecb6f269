#pragma once

#include "pngfiles/chunk.hpp"
#include "pngfiles/constants.hpp"
#include "pngfiles/container.hpp"
#include "pngfiles/errors.hpp"
#include "pngfiles/file_record.hpp"
#include "pngfiles/format.hpp"
