#pragma once

#include <fc/exception/exception.hpp>

namespace pifp { namespace oracle {

FC_DECLARE_EXCEPTION(         oracle_exception,                                             40000, "Oracle Exception" );
/** a failure worth retrying, e.g. an unreachable evidence source */
FC_DECLARE_DERIVED_EXCEPTION( oracle_transient_failure,     pifp::oracle::oracle_exception, 40001, "transient oracle failure" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_request,              pifp::oracle::oracle_exception, 40002, "unknown proof request" );
FC_DECLARE_DERIVED_EXCEPTION( oracle_not_open,              pifp::oracle::oracle_exception, 40003, "oracle service is not open" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_oracle_config,        pifp::oracle::oracle_exception, 40004, "invalid oracle configuration" );

} } // pifp::oracle
