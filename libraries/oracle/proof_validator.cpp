#include <pifp/oracle/exceptions.hpp>
#include <pifp/oracle/proof_validator.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/io/raw.hpp>
#include <fc/log/logger.hpp>

namespace pifp { namespace oracle {

digest_type signed_payload::digest()const
{
   return fc::sha256::hash( body.data(), body.size() );
}

digest_match_validator::digest_match_validator( const vector<digest_type>& accepted_digests )
   : _accepted_digests( accepted_digests.begin(), accepted_digests.end() )
{
}

validation_result digest_match_validator::validate( const proof_request& request )const
{
   const digest_type payload_digest = fc::sha256::hash( request.proof_payload.data(), request.proof_payload.size() );
   if( _accepted_digests.count( payload_digest ) == 0 )
      return validation_result::reject( "payload digest " + payload_digest.str() + " is not accepted" );
   return validation_result::accept();
}

signed_payload_validator::signed_payload_validator( const address& attester )
   : _attester( attester )
{
}

validation_result signed_payload_validator::validate( const proof_request& request )const
{
   signed_payload payload;
   try
   {
      payload = fc::raw::unpack<signed_payload>( request.proof_payload );
   }
   catch( const fc::exception& e )
   {
      return validation_result::reject( "malformed signed payload: " + e.to_string() );
   }

   address signer;
   try
   {
      signer = address( fc::ecc::public_key( payload.signature, payload.digest() ) );
   }
   catch( const fc::exception& e )
   {
      return validation_result::reject( "unrecoverable payload signature: " + e.to_string() );
   }

   if( signer != _attester )
      return validation_result::reject( "payload signed by " + string( signer ) + " instead of " + string( _attester ) );
   return validation_result::accept();
}

proof_validator_ptr make_validator( const validator_config& config )
{ try {
   if( config.type == "digest_match" )
      return std::make_shared<digest_match_validator>( config.accepted_digests );

   if( config.type == "signed_payload" )
   {
      if( !config.attester.valid() )
         FC_THROW_EXCEPTION( invalid_oracle_config, "signed_payload validator requires an attester" );
      return std::make_shared<signed_payload_validator>( *config.attester );
   }

   FC_THROW_EXCEPTION( invalid_oracle_config, "unknown validator type ${type}", ("type",config.type) );
} FC_CAPTURE_AND_RETHROW( (config) ) }

void validator_registry::register_validator( const digest_type& schema_hash, const proof_validator_ptr& validator )
{
   FC_ASSERT( validator, "null validator for schema ${schema}", ("schema",schema_hash) );
   _validators[ schema_hash ] = validator;
}

void validator_registry::set_default_validator( const proof_validator_ptr& validator )
{
   _default_validator = validator;
}

proof_validator_ptr validator_registry::find_validator( const digest_type& schema_hash )const
{
   const auto itr = _validators.find( schema_hash );
   if( itr != _validators.end() )
      return itr->second;
   return _default_validator;
}

void validator_registry::configure( const oracle_config& config )
{ try {
   _validators.clear();
   _default_validator.reset();

   for( const schema_binding& binding : config.schema_bindings )
      register_validator( binding.schema_hash, make_validator( binding.validator ) );

   if( config.default_validator.valid() )
      set_default_validator( make_validator( *config.default_validator ) );

   fc_ilog( fc::logger::get("oracle"), "configured ${n} schema validators", ("n",_validators.size()) );
} FC_CAPTURE_AND_RETHROW( (config) ) }

} } // pifp::oracle
