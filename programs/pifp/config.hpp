#pragma once

#include <pifp/oracle/config.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/optional.hpp>

namespace pifp { namespace node {

    struct config
    {
        fc::logging_config              logging = fc::logging_config::default_config();
        /** used only when the data directory does not hold a ledger yet */
        fc::optional<fc::path>          genesis_config;
        bool                            oracle_enabled = false;
        pifp::oracle::oracle_config     oracle;
    };

    fc::logging_config create_default_logging_config( const fc::path& data_dir );

    /** loads data_dir/config.json, writing a default one first when it is missing */
    config load_config( const fc::path& data_dir );

} } // pifp::node

FC_REFLECT( pifp::node::config, (logging)(genesis_config)(oracle_enabled)(oracle) )
