#pragma once

#include "box.hpp"
#include "buffers.hpp"
#include "common.hpp"
#include "dynamic_array.hpp"
#include "image.hpp"
#include "optional.hpp"
#include "pair.hpp"
#include "scalar.hpp"
#include "slice.hpp"
#include "static_array.hpp"
#include "string.hpp"
#include "tuple.hpp"
#include "utility.hpp"
#include "variant.hpp"
