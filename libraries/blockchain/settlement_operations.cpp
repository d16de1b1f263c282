#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/settlement_operations.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   namespace detail
   {
      void credit_balance( transaction_evaluation_state& eval_state, const address& owner, share_type amount )
      { try {
         if( amount <= 0 ) return;

         obalance_record record = eval_state.pending_state()->get_balance_record( owner );
         if( !record.valid() )
            record = balance_record( owner );

         if( record->balance > PIFP_BLOCKCHAIN_MAX_SHARES - amount )
            FC_CAPTURE_AND_THROW( addition_overflow, (record->balance)(amount) );

         record->balance += amount;
         record->last_update = eval_state.pending_state()->now();
         eval_state.pending_state()->store_balance_record( *record );
      } FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }
   }

   bool release_project_funds( transaction_evaluation_state& eval_state, project_record& project )
   { try {
      if( project.status != completed_status )
         FC_CAPTURE_AND_THROW( invalid_state, (project.id)(project.status) );

      if( project.settled )
         return false;

      pending_chain_state* const pending_state = eval_state.pending_state();
      const time_point_sec now = pending_state->now();

      share_type fee = 0;
      const optional<address> fee_collector = pending_state->get_fee_collector();
      if( fee_collector.valid() )
         fee = project.funded_amount * pending_state->get_protocol_fee_bps() / PIFP_BLOCKCHAIN_BASIS_POINTS;

      const share_type payable = project.funded_amount - fee;

      detail::credit_balance( eval_state, project.implementer, payable );
      if( fee > 0 )
         detail::credit_balance( eval_state, *fee_collector, fee );

      for( donation_id_type id = 1; id <= project.donation_count; ++id )
      {
         odonation_record donation = pending_state->get_donation_record( donation_index{ project.id, id } );
         FC_ASSERT( donation.valid(), "missing donation ${id} of project ${pid}", ("id",id)("pid",project.id) );
         if( donation->is_settled() ) continue;

         donation->state = donation_released;
         donation->settled_at = now;
         pending_state->store_donation_record( *donation );
      }

      project.settled = true;
      project.released_amount = payable;
      project.fee_amount = fee;
      project.last_update = now;
      pending_state->store_project_record( project );

      ilog( "released ${payable} to ${implementer} for project ${id}, fee ${fee}",
            ("payable",payable)("implementer",project.implementer)("id",project.id)("fee",fee) );

      event_record event( funds_released_event, project.id );
      event.account = project.implementer;
      event.amount = payable;
      eval_state.emit( event );
      return true;
   } FC_CAPTURE_AND_RETHROW( (project) ) }

   void release_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      oproject_record project = eval_state.pending_state()->get_project_record( this->project_id );
      if( !project.valid() )
         FC_CAPTURE_AND_THROW( unknown_project, (project_id) );

      if( !release_project_funds( eval_state, *project ) )
         ilog( "project ${id} already settled", ("id",project_id) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void refund_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      pending_chain_state* const pending_state = eval_state.pending_state();

      oproject_record project = pending_state->get_project_record( this->project_id );
      if( !project.valid() )
         FC_CAPTURE_AND_THROW( unknown_project, (project_id) );

      if( project->status != expired_status )
         FC_CAPTURE_AND_THROW( invalid_state, (project->status) );

      odonation_record donation = pending_state->get_donation_record( donation_index{ project_id, donation_id } );
      if( !donation.valid() )
         FC_CAPTURE_AND_THROW( unknown_donation, (project_id)(donation_id) );

      if( donation->is_settled() )
         FC_CAPTURE_AND_THROW( already_settled, (donation->index)(donation->state) );

      if( !verify_donation( donation->donor_commitment, this->secret, donation->amount ) )
         FC_CAPTURE_AND_THROW( unauthorized, (donation->index) );

      if( !eval_state.check_signature( this->secret.owner ) )
         FC_CAPTURE_AND_THROW( missing_signature, (secret.owner) );

      const time_point_sec now = pending_state->now();

      donation->state = donation_refunded;
      donation->settled_at = now;

      project->refunded_amount += donation->amount;
      project->last_update = now;
      pending_state->store_project_record( *project );
      pending_state->store_donation_record( *donation );

      detail::credit_balance( eval_state, this->secret.owner, donation->amount );

      event_record event( refunded_event, project->id );
      event.amount = donation->amount;
      event.donation_id = donation_id;
      eval_state.emit( event );
   } FC_CAPTURE_AND_RETHROW( (project_id)(donation_id) ) }

} } // pifp::blockchain
