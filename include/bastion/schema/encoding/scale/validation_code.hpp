#pragma once

#include <bastion/schema/validation_code.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(bastion::schema,
                             validation_code_t,
                             bastion::schema::validation_code_t::accepted,
                             bastion::schema::validation_code_t::rejected)
