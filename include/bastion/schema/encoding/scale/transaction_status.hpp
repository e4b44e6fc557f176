#pragma once

#include <bastion/schema/transaction_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(bastion::schema,
                             transaction_status_t,
                             bastion::schema::transaction_status_t::proposed,
                             bastion::schema::transaction_status_t::executable,
                             bastion::schema::transaction_status_t::executed)
