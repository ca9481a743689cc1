#pragma once

#include "abi_error.hpp"
#include "type_tag.hpp"
#include "value.hpp"
#include "word.hpp"
#include "encoder.hpp"
#include "decoder.hpp"
#include "signature.hpp"
