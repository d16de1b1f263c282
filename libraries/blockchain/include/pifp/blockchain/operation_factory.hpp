#pragma once
#include <pifp/blockchain/operations.hpp>
#include <pifp/blockchain/exceptions.hpp>

#include <fc/variant_object.hpp>

#include <memory>
#include <unordered_map>

namespace pifp { namespace blockchain {

   /**
    * @class operation_factory
    *
    *  Maps operation type ids to the code that converts and evaluates them.
    *  Every operation is registered once, in operations.cpp.
    */
   class operation_factory
   {
       public:
          static operation_factory& instance();
          class operation_converter_base
          {
             public:
                  virtual ~operation_converter_base(){};
                  virtual void to_variant( const pifp::blockchain::operation& in, fc::variant& out ) = 0;
                  virtual void from_variant( const fc::variant& in, pifp::blockchain::operation& out ) = 0;
                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op ) = 0;
          };

          template<typename OperationType>
          class operation_converter : public operation_converter_base
          {
             public:
                  virtual void to_variant( const pifp::blockchain::operation& in, fc::variant& output )
                  { try {
                     FC_ASSERT( in.type == OperationType::type );
                     fc::mutable_variant_object obj( "type", in.type );

                     obj[ "data" ] = fc::raw::unpack<OperationType>(in.data);

                     output = std::move(obj);
                  } FC_RETHROW_EXCEPTIONS( warn, "" ) }

                  virtual void from_variant( const fc::variant& in, pifp::blockchain::operation& output )
                  { try {
                     auto obj = in.get_object();

                     FC_ASSERT( output.type == OperationType::type );
                     output.data = fc::raw::pack( obj["data"].as<OperationType>() );
                  } FC_RETHROW_EXCEPTIONS( warn, "type: ${type}", ("type",fc::get_typename<OperationType>::name()) ) }

                  virtual void evaluate( transaction_evaluation_state& eval_state, const operation& op )
                  { try {
                     op.as<OperationType>().evaluate( eval_state );
                  } FC_CAPTURE_AND_RETHROW( (op) ) }
          };

          template<typename OperationType>
          void register_operation()
          {
             FC_ASSERT( _converters.find( OperationType::type ) == _converters.end(),
                        "Operation ID already Registered ${id}", ("id",OperationType::type) );
            _converters[OperationType::type] = std::make_shared< operation_converter<OperationType> >();
          }

          void evaluate( transaction_evaluation_state& eval_state, const operation& op )
          {
             auto itr = _converters.find( uint8_t(op.type) );
             if( itr == _converters.end() )
                FC_THROW_EXCEPTION( pifp::blockchain::unsupported_chain_operation, "", ("type",uint8_t(op.type)) );
             itr->second->evaluate( eval_state, op );
          }

          /// defined in operations.cpp
          void to_variant( const pifp::blockchain::operation& in, fc::variant& output );
          /// defined in operations.cpp
          void from_variant( const fc::variant& in, pifp::blockchain::operation& output );
       private:

          std::unordered_map<int, std::shared_ptr<operation_converter_base> > _converters;

   };

} } // pifp::blockchain
