#pragma once

#include "core/Error.hpp"
#include "path/Path.hpp"
#include "path/Paths.hpp"
#include "serialization/PathJson.hpp"
