#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/oracle_operations.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/settlement_operations.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   attest_proof_operation attest_proof_operation::sign( const private_key_type& oracle_key,
                                                        const digest_type& chain_id,
                                                        const proof_index& proof,
                                                        const commitment_type& proof_commitment,
                                                        verdict_type verdict,
                                                        const time_point_sec timestamp )
   { try {
      attest_proof_operation op;
      op.proof = proof;
      op.proof_commitment = proof_commitment;
      op.verdict = verdict;
      op.timestamp = timestamp;
      op.oracle_signature = oracle_key.sign_compact( attestation_digest( chain_id, proof, proof_commitment, verdict, timestamp ) );
      return op;
   } FC_CAPTURE_AND_RETHROW( (proof)(proof_commitment)(verdict) ) }

   address attest_proof_operation::signer( const digest_type& chain_id )const
   { try {
      const digest_type digest = attestation_digest( chain_id, proof, proof_commitment, verdict, timestamp );
      return address( fc::ecc::public_key( oracle_signature, digest, true ) );
   } FC_CAPTURE_AND_RETHROW( (proof)(verdict) ) }

   void attest_proof_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      pending_chain_state* const pending_state = eval_state.pending_state();

      address oracle;
      try
      {
         oracle = signer( pending_state->get_chain_id() );
      }
      catch( const fc::exception& e )
      {
         FC_CAPTURE_AND_THROW( unauthorized_oracle, (proof)(e.to_string()) );
      }

      if( !pending_state->has_role( oracle, oracle_role ) )
         FC_CAPTURE_AND_THROW( unauthorized_oracle, (oracle)(proof) );

      if( pending_state->get_attestation_record( this->proof ).valid() )
         FC_CAPTURE_AND_THROW( already_settled, (proof) );

      if( this->verdict != verified_verdict && this->verdict != rejected_verdict )
         FC_CAPTURE_AND_THROW( invalid_parameters, (verdict) );

      oproof_record proof_rec = pending_state->get_proof_record( this->proof );
      if( !proof_rec.valid() )
         FC_CAPTURE_AND_THROW( unknown_proof, (proof) );

      if( proof_rec->proof_commitment != this->proof_commitment )
         FC_CAPTURE_AND_THROW( invalid_parameters, (proof_rec->proof_commitment)(proof_commitment) );

      oproject_record project = pending_state->get_project_record( this->proof.project_id );
      FC_ASSERT( project.valid(), "proof without a project", ("proof",proof) );

      if( project->status != proof_submitted_status || project->active_submission != this->proof.submission )
         FC_CAPTURE_AND_THROW( invalid_state, (project->status)(project->active_submission)(proof) );

      const time_point_sec now = pending_state->now();

      attestation_record attestation;
      attestation.proof = this->proof;
      attestation.oracle = oracle;
      attestation.verdict = this->verdict;
      attestation.oracle_signature = this->oracle_signature;
      attestation.signed_at = this->timestamp;
      attestation.recorded_at = now;

      proof_rec->result = this->verdict;
      pending_state->store_proof_record( *proof_rec );
      pending_state->store_attestation_record( attestation );

      event_record verified( proof_verified_event, project->id );
      verified.account = oracle;
      verified.submission = this->proof.submission;
      verified.verdict = this->verdict;
      eval_state.emit( verified );

      project->active_submission = 0;
      project->last_update = now;

      if( this->verdict == verified_verdict )
      {
         ilog( "proof ${proof} of project ${id} verified by ${oracle}", ("proof",proof.submission)("id",project->id)("oracle",oracle) );
         project->status = completed_status;
         pending_state->store_project_record( *project );
         release_project_funds( eval_state, *project );
      }
      else if( project->is_past_deadline( now ) )
      {
         wlog( "proof ${proof} of project ${id} rejected after the deadline", ("proof",proof.submission)("id",project->id) );
         project->status = expired_status;
         pending_state->store_project_record( *project );
         eval_state.emit( event_record( project_expired_event, project->id ) );
      }
      else
      {
         wlog( "proof ${proof} of project ${id} rejected", ("proof",proof.submission)("id",project->id) );
         project->status = active_status;
         pending_state->store_project_record( *project );
      }
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pifp::blockchain
