#include <pifp/blockchain/balance_operations.hpp>
#include <pifp/blockchain/operation_factory.hpp>
#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/oracle_operations.hpp>
#include <pifp/blockchain/project_operations.hpp>
#include <pifp/blockchain/role_operations.hpp>
#include <pifp/blockchain/settlement_operations.hpp>

#include <fc/io/raw_variant.hpp>
#include <fc/reflect/variant.hpp>

namespace pifp { namespace blockchain {

    const operation_type_enum withdraw_operation::type                  = withdraw_op_type;

    const operation_type_enum register_project_operation::type          = register_project_op_type;
    const operation_type_enum deposit_operation::type                   = deposit_op_type;
    const operation_type_enum submit_proof_operation::type              = submit_proof_op_type;
    const operation_type_enum check_expiry_operation::type              = check_expiry_op_type;

    const operation_type_enum attest_proof_operation::type              = attest_proof_op_type;

    const operation_type_enum release_operation::type                   = release_op_type;
    const operation_type_enum refund_operation::type                    = refund_op_type;

    const operation_type_enum grant_role_operation::type                = grant_role_op_type;
    const operation_type_enum revoke_role_operation::type               = revoke_role_op_type;
    const operation_type_enum transfer_super_admin_operation::type      = transfer_super_admin_op_type;

    static bool first_chain = []() -> bool
    {
        pifp::blockchain::operation_factory::instance().register_operation<withdraw_operation>();

        pifp::blockchain::operation_factory::instance().register_operation<register_project_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<deposit_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<submit_proof_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<check_expiry_operation>();

        pifp::blockchain::operation_factory::instance().register_operation<attest_proof_operation>();

        pifp::blockchain::operation_factory::instance().register_operation<release_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<refund_operation>();

        pifp::blockchain::operation_factory::instance().register_operation<grant_role_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<revoke_role_operation>();
        pifp::blockchain::operation_factory::instance().register_operation<transfer_super_admin_operation>();

        return true;
    }();

    operation_factory& operation_factory::instance()
    { try {
        static std::unique_ptr<operation_factory> inst( new operation_factory() );
        return *inst;
    } FC_CAPTURE_AND_RETHROW() }

    void operation_factory::to_variant( const pifp::blockchain::operation& in, fc::variant& output )
    { try {
        auto converter_itr = _converters.find( in.type.value );
        FC_ASSERT( converter_itr != _converters.end() );
        converter_itr->second->to_variant( in, output );
    } FC_CAPTURE_AND_RETHROW() }

    void operation_factory::from_variant( const fc::variant& in, pifp::blockchain::operation& output )
    { try {
        auto obj = in.get_object();
        output.type = obj["type"].as<operation_type_enum>();

        auto converter_itr = _converters.find( output.type.value );
        FC_ASSERT( converter_itr != _converters.end() );
        converter_itr->second->from_variant( in, output );
    } FC_CAPTURE_AND_RETHROW( (in) ) }

} } // pifp::blockchain

namespace fc
{
    void to_variant( const pifp::blockchain::operation& var, variant& vo )
    {
        pifp::blockchain::operation_factory::instance().to_variant( var, vo );
    }

    void from_variant( const variant& var, pifp::blockchain::operation& vo )
    {
        pifp::blockchain::operation_factory::instance().from_variant( var, vo );
    }
}
