#pragma once

#include <agora/abci/v1/application.grpc.pb.h>
#include <agora/execution/engine.hpp>

namespace agora::abci {

/// ABCI-style callback listener used by the consensus client to drive the
/// governance engine.
///
/// Quick reference:
/// - Echo/Flush: liveness and flush barriers.
/// - Info: handshake; last committed height and state root.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side filtering of txs that fail CheckTx.
/// - FinalizeBlock: execute block at the block time and return tx results
///   plus the candidate state root.
/// - Commit: persist finalized state.
/// - Query: read-path queries against committed state.
struct listener final : public agora::abci::v1::Application::CallbackService {
  explicit listener(agora::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestEcho* request,
      agora::abci::v1::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestFlush* request,
      agora::abci::v1::ResponseFlush* response) override final;

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestInfo* request,
      agora::abci::v1::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestCheckTx* request,
      agora::abci::v1::ResponseCheckTx* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestQuery* request,
      agora::abci::v1::ResponseQuery* response) override final;

  /// Proposer-side tx list preparation under max-bytes and validity checks.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestPrepareProposal* request,
      agora::abci::v1::ResponsePrepareProposal* response) override final;

  /// Execute ordered block transactions and return tx results + state root.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestFinalizeBlock* request,
      agora::abci::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const agora::abci::v1::RequestCommit* request,
      agora::abci::v1::ResponseCommit* response) override final;

  agora::execution::engine& execution_engine_;
};

}  // namespace agora::abci
