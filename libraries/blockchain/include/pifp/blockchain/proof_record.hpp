#pragma once

#include <pifp/blockchain/types.hpp>

#include <tuple>

namespace pifp { namespace blockchain {

struct proof_index
{
    proof_index(){}
    proof_index( project_id_type pid, submission_id_type sid )
        :project_id(pid),submission(sid){}

    project_id_type     project_id = 0;
    submission_id_type  submission = 0;

    friend bool operator < ( const proof_index& a, const proof_index& b )
    {
        return std::tie( a.project_id, a.submission ) < std::tie( b.project_id, b.submission );
    }

    friend bool operator == ( const proof_index& a, const proof_index& b )
    {
        return std::tie( a.project_id, a.submission ) == std::tie( b.project_id, b.submission );
    }
};

enum verdict_type
{
    pending_verdict     = 0,
    verified_verdict    = 1,
    rejected_verdict    = 2
};

struct proof_record;
typedef fc::optional<proof_record> oproof_record;

class chain_interface;

/**
 *  An implementer's commitment to a proof payload that is delivered to the
 *  oracle out of band.  The result is written exactly once, by the attestation;
 *  superseded submissions stay in the database as an audit trail.
 */
struct proof_record
{
    bool is_pending()const { return result == pending_verdict; }

    proof_index                                 index;
    commitment_type                             proof_commitment;
    address                                     submitter;
    time_point_sec                              timestamp;
    fc::enum_type<uint8_t,verdict_type>         result = pending_verdict;

    void sanity_check( const chain_interface& )const;
    static oproof_record lookup( const chain_interface&, const proof_index& );
    static void store( chain_interface&, const proof_index&, const proof_record& );
    static void remove( chain_interface&, const proof_index& );
};

class proof_db_interface
{
    friend struct proof_record;

    virtual oproof_record proof_lookup_by_index( const proof_index& )const = 0;
    virtual void proof_insert_into_index_map( const proof_index&, const proof_record& ) = 0;
    virtual void proof_erase_from_index_map( const proof_index& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::proof_index, (project_id)(submission) )
FC_REFLECT_ENUM( pifp::blockchain::verdict_type, (pending_verdict)(verified_verdict)(rejected_verdict) )
FC_REFLECT( pifp::blockchain::proof_record, (index)(proof_commitment)(submitter)(timestamp)(result) )
