#include "config.hpp"

#include <pifp/blockchain/config.hpp>

#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <iostream>

namespace pifp { namespace node {

fc::logging_config create_default_logging_config( const fc::path& data_dir )
{
   fc::logging_config cfg;
   fc::path log_dir("logs");

   fc::file_appender::config ac;
   ac.filename             = log_dir / "pifp.log";
   ac.flush                = true;
   ac.rotate               = true;
   ac.rotation_interval    = fc::hours( 1 );
   ac.rotation_limit       = fc::days( 1 );
   ac.rotation_compression = false;

   std::cout << "Logging to file: " << (data_dir / ac.filename).preferred_string() << "\n";

   fc::file_appender::config ac_oracle;
   ac_oracle.filename             = log_dir / "oracle.log";
   ac_oracle.flush                = true;
   ac_oracle.rotate               = true;
   ac_oracle.rotation_interval    = fc::hours( 1 );
   ac_oracle.rotation_limit       = fc::days( 1 );
   ac_oracle.rotation_compression = false;

   fc::variants  c  {
      fc::mutable_variant_object( "level","debug")("color", "green"),
            fc::mutable_variant_object( "level","warn")("color", "brown"),
            fc::mutable_variant_object( "level","error")("color", "red") };

   cfg.appenders.push_back(
            fc::appender_config( "stderr", "console",
                                 fc::mutable_variant_object()
                                 ( "stream","std_error")
                                 ( "level_colors", c )
                                 ) );

   cfg.appenders.push_back(fc::appender_config( "default", "file", fc::variant(ac)));
   cfg.appenders.push_back(fc::appender_config( "oracle", "file", fc::variant(ac_oracle)));

   fc::logger_config dlc;
#ifdef PIFP_TEST_NETWORK
   dlc.level = fc::log_level::debug;
#else
   dlc.level = fc::log_level::info;
#endif
   dlc.name = "default";
   dlc.appenders.push_back("default");
   dlc.appenders.push_back("stderr");

   fc::logger_config dlc_oracle;
   dlc_oracle.level = fc::log_level::debug;
   dlc_oracle.name = "oracle";
   dlc_oracle.appenders.push_back("oracle");

   cfg.loggers.push_back(dlc);
   cfg.loggers.push_back(dlc_oracle);

   return cfg;
}

config load_config( const fc::path& data_dir )
{ try {
   const fc::path config_file = data_dir / PIFP_DEFAULT_CONFIG_FILE;
   config cfg;
   if( fc::exists( config_file ) )
   {
      std::cout << "Loading config from file: " << config_file.preferred_string() << "\n";
      cfg = fc::json::from_file( config_file ).as<config>();
   }
   else
   {
      std::cerr << "Creating default config file at: " << config_file.preferred_string() << "\n";
      cfg.logging = create_default_logging_config( data_dir );
      fc::create_directories( data_dir );
      fc::json::save_to_file( cfg, config_file );
   }

   // the logging_config may contain relative paths.  If it does, expand those to full
   // paths, relative to the data_dir
   for( fc::appender_config& appender : cfg.logging.appenders )
   {
      if( appender.type != "file" )
         continue;

      fc::file_appender::config file_appender_config = appender.args.as<fc::file_appender::config>();
      if( file_appender_config.filename.is_relative() )
      {
         file_appender_config.filename = fc::absolute( data_dir / file_appender_config.filename );
         appender.args = fc::variant( file_appender_config );
      }
   }

   return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config file ${cfg}", ("cfg",data_dir/PIFP_DEFAULT_CONFIG_FILE) ) }

} } // pifp::node
