#pragma once

#include <ledgersync/schema/vote.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(ledgersync::schema,
                             vote_t,
                             ledgersync::schema::vote_t::absent,
                             ledgersync::schema::vote_t::aye,
                             ledgersync::schema::vote_t::nay)
