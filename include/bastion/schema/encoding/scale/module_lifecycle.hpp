#pragma once

#include <bastion/schema/module_lifecycle.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(bastion::schema,
                             module_lifecycle_t,
                             bastion::schema::module_lifecycle_t::uninitialized,
                             bastion::schema::module_lifecycle_t::active)
