#include <pifp/blockchain/balance_operations.hpp>
#include <pifp/blockchain/project_operations.hpp>
#include <pifp/blockchain/role_operations.hpp>
#include <pifp/blockchain/settlement_operations.hpp>
#include <pifp/blockchain/transaction.hpp>

#include <fc/io/raw_variant.hpp>

namespace pifp { namespace blockchain {

   digest_type transaction::digest( const digest_type& chain_id )const
   {
      fc::sha256::encoder enc;
      fc::raw::pack( enc, *this );
      fc::raw::pack( enc, chain_id );
      return enc.result();
   }

   transaction_id_type signed_transaction::id()const
   {
      fc::sha512::encoder enc;
      fc::raw::pack( enc, *this );
      return fc::ripemd160::hash( enc.result() );
   }

   void signed_transaction::sign( const fc::ecc::private_key& signer, const digest_type& chain_id )
   {
      signatures.push_back( signer.sign_compact( digest( chain_id ) ) );
   }

   void transaction::withdraw( const balance_id_type& account, share_type amount )
   { try {
      FC_ASSERT( amount > 0, "amount: ${amount}", ("amount",amount) );
      operations.emplace_back( withdraw_operation( account, amount ) );
   } FC_CAPTURE_AND_RETHROW( (account)(amount) ) }

   void transaction::register_project( const address& creator,
                                       const address& implementer,
                                       share_type target,
                                       const time_point_sec deadline,
                                       const digest_type& proof_schema_hash )
   {
      register_project_operation op;
      op.creator = creator;
      op.implementer = implementer;
      op.target = target;
      op.deadline = deadline;
      op.proof_schema_hash = proof_schema_hash;

      operations.emplace_back( std::move( op ) );
   }

   void transaction::deposit( project_id_type project_id,
                              share_type amount,
                              const commitment_type& donor_commitment,
                              const balance_id_type& donor_balance )
   { try {
      withdraw( donor_balance, amount );
      operations.emplace_back( deposit_operation( project_id, amount, donor_commitment ) );
   } FC_CAPTURE_AND_RETHROW( (project_id)(amount)(donor_balance) ) }

   void transaction::submit_proof( project_id_type project_id, const commitment_type& proof_commitment )
   {
      submit_proof_operation op;
      op.project_id = project_id;
      op.proof_commitment = proof_commitment;

      operations.emplace_back( std::move( op ) );
   }

   void transaction::release( project_id_type project_id )
   {
      operations.emplace_back( release_operation( project_id ) );
   }

   void transaction::refund( project_id_type project_id, donation_id_type donation_id, const commitment_secret& secret )
   {
      refund_operation op;
      op.project_id = project_id;
      op.donation_id = donation_id;
      op.secret = secret;

      operations.emplace_back( std::move( op ) );
   }

   void transaction::check_expiry( project_id_type project_id )
   {
      operations.emplace_back( check_expiry_operation( project_id ) );
   }

   void transaction::grant_role( const address& caller, const address& target, role_type role )
   {
      grant_role_operation op;
      op.caller = caller;
      op.target = target;
      op.role = role;

      operations.emplace_back( std::move( op ) );
   }

   void transaction::revoke_role( const address& caller, const address& target )
   {
      revoke_role_operation op;
      op.caller = caller;
      op.target = target;

      operations.emplace_back( std::move( op ) );
   }

   void transaction::transfer_super_admin( const address& current_admin, const address& new_admin )
   {
      transfer_super_admin_operation op;
      op.current_admin = current_admin;
      op.new_admin = new_admin;

      operations.emplace_back( std::move( op ) );
   }

} } // pifp::blockchain
