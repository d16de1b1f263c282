#pragma once
#include <fc/exception/exception.hpp>

namespace pifp { namespace db {

FC_DECLARE_EXCEPTION( level_map_failure,            10000, "level_map failure" );
FC_DECLARE_EXCEPTION( level_map_open_failure,       10001, "level_map open failure" );
FC_DECLARE_EXCEPTION( level_map_closed,             10002, "level_map is not open" );

} } // pifp::db
