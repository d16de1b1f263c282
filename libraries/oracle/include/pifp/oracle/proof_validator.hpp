#pragma once

#include <pifp/oracle/config.hpp>
#include <pifp/oracle/types.hpp>

#include <map>
#include <memory>
#include <set>

namespace pifp { namespace oracle {

struct validation_result
{
   static validation_result accept() { return validation_result{ true, string() }; }
   static validation_result reject( const string& reason ) { return validation_result{ false, reason }; }

   bool     accepted;
   string   reason;
};

/**
 *  Decides whether a proof payload demonstrates the outcome its schema describes.
 *  Implementations return a rejection for proofs that do not hold up, and throw
 *  oracle_transient_failure only when the decision could not be made at all.
 */
class proof_validator
{
   public:
      virtual ~proof_validator(){}

      virtual string              name()const = 0;
      virtual validation_result   validate( const proof_request& request )const = 0;
};
typedef std::shared_ptr<proof_validator> proof_validator_ptr;

/** accepts a payload whose sha256 is one of a fixed set of digests */
class digest_match_validator : public proof_validator
{
   public:
      explicit digest_match_validator( const vector<digest_type>& accepted_digests );

      virtual string              name()const override { return "digest_match"; }
      virtual validation_result   validate( const proof_request& request )const override;

   private:
      std::set<digest_type>       _accepted_digests;
};

/** accepts a packed signed_payload whose body was signed by the attester */
class signed_payload_validator : public proof_validator
{
   public:
      explicit signed_payload_validator( const address& attester );

      virtual string              name()const override { return "signed_payload"; }
      virtual validation_result   validate( const proof_request& request )const override;

   private:
      address                     _attester;
};

proof_validator_ptr make_validator( const validator_config& config );

/**
 *  Selects the validator for a proof by the schema hash its project registered.
 */
class validator_registry
{
   public:
      void                 register_validator( const digest_type& schema_hash, const proof_validator_ptr& validator );
      void                 set_default_validator( const proof_validator_ptr& validator );

      /** the bound validator, else the default one, else null */
      proof_validator_ptr  find_validator( const digest_type& schema_hash )const;

      void                 configure( const oracle_config& config );

   private:
      std::map<digest_type, proof_validator_ptr>   _validators;
      proof_validator_ptr                          _default_validator;
};

} } // pifp::oracle
