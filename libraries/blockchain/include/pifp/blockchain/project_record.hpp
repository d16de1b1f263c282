#pragma once

#include <pifp/blockchain/types.hpp>

namespace pifp { namespace blockchain {

enum project_status
{
    funding_status          = 0,
    active_status           = 1,
    proof_submitted_status  = 2,
    completed_status        = 3,
    expired_status          = 4,
    /** reserved; expired projects are refundable directly */
    refunding_status        = 5
};

struct project_record;
typedef fc::optional<project_record> oproject_record;

class chain_interface;

/**
 *  A funding project and its lifecycle state.
 *
 *  Funding -> Active once funded_amount reaches target.  Active -> ProofSubmitted when the
 *  implementer commits to a proof.  An oracle attestation then moves it to Completed
 *  (funds released) or back to Active, or to Expired when the deadline has passed.
 *  Any non-terminal project moves to Expired through check_expiry after the deadline.
 *  Completed and Expired are terminal.
 */
struct project_record
{
    bool is_past_deadline( const time_point_sec now )const { return now > deadline; }

    /** funded_amount less what has already been paid out or refunded */
    share_type locked_amount()const;

    project_id_type                             id = 0;
    address                                     creator;
    /** receives released funds; defaults to the creator */
    address                                     implementer;
    share_type                                  target = 0;
    share_type                                  funded_amount = 0;
    time_point_sec                              deadline;
    digest_type                                 proof_schema_hash;
    fc::enum_type<uint8_t,project_status>       status = funding_status;

    donation_id_type                            donation_count = 0;
    submission_id_type                          submission_count = 0;
    /** the submission the next attestation must refer to, 0 when none */
    submission_id_type                          active_submission = 0;

    /** guards release; set once and never cleared */
    bool                                        settled = false;
    share_type                                  released_amount = 0;
    share_type                                  fee_amount = 0;
    share_type                                  refunded_amount = 0;

    time_point_sec                              registration_date;
    time_point_sec                              last_update;

    void sanity_check( const chain_interface& )const;
    static oproject_record lookup( const chain_interface&, const project_id_type );
    static void store( chain_interface&, const project_id_type, const project_record& );
    static void remove( chain_interface&, const project_id_type );
};

class project_db_interface
{
    friend struct project_record;

    virtual oproject_record project_lookup_by_id( const project_id_type )const = 0;
    virtual void project_insert_into_id_map( const project_id_type, const project_record& ) = 0;
    virtual void project_erase_from_id_map( const project_id_type ) = 0;
};

} } // pifp::blockchain

FC_REFLECT_ENUM( pifp::blockchain::project_status,
        (funding_status)
        (active_status)
        (proof_submitted_status)
        (completed_status)
        (expired_status)
        (refunding_status)
        )
FC_REFLECT( pifp::blockchain::project_record,
        (id)
        (creator)
        (implementer)
        (target)
        (funded_amount)
        (deadline)
        (proof_schema_hash)
        (status)
        (donation_count)
        (submission_count)
        (active_submission)
        (settled)
        (released_amount)
        (fee_amount)
        (refunded_amount)
        (registration_date)
        (last_update)
        )
