#pragma once

#include <pifp/blockchain/commitment.hpp>
#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/proof_record.hpp>
#include <pifp/blockchain/role_record.hpp>

#include <fc/reflect/variant.hpp>

namespace pifp { namespace blockchain {

   struct transaction
   {
      fc::time_point_sec    expiration;
      /** distinguishes otherwise identical transactions, e.g. a repeated release */
      optional<uint64_t>    nonce;
      vector<operation>     operations;

      digest_type digest( const digest_type& chain_id )const;

      void withdraw( const balance_id_type& account, share_type amount );

      void register_project( const address& creator,
                             const address& implementer,
                             share_type target,
                             const time_point_sec deadline,
                             const digest_type& proof_schema_hash );

      /** withdraws amount from donor_balance and locks it in the project */
      void deposit( project_id_type project_id,
                    share_type amount,
                    const commitment_type& donor_commitment,
                    const balance_id_type& donor_balance );

      void submit_proof( project_id_type project_id, const commitment_type& proof_commitment );

      void release( project_id_type project_id );

      void refund( project_id_type project_id, donation_id_type donation_id, const commitment_secret& secret );

      void check_expiry( project_id_type project_id );

      void grant_role( const address& caller, const address& target, role_type role );

      void revoke_role( const address& caller, const address& target );

      void transfer_super_admin( const address& current_admin, const address& new_admin );
   }; // transaction

   struct signed_transaction : public transaction
   {
      transaction_id_type   id()const;
      void                  sign( const fc::ecc::private_key& signer, const digest_type& chain_id );

      vector<fc::ecc::compact_signature> signatures;
   };
   typedef vector<signed_transaction> signed_transactions;
   typedef optional<signed_transaction> osigned_transaction;

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::transaction, (expiration)(nonce)(operations) )
FC_REFLECT_DERIVED( pifp::blockchain::signed_transaction, (pifp::blockchain::transaction), (signatures) )
