/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/builder.hpp"

#include "clock/impl/system_clock.hpp"
#include "vm/actor/builtin/multisig/multisig_actor.hpp"
#include "vm/actor/builtin/token/token_actor.hpp"
#include "vm/actor/builtin/vesting/vesting_actor.hpp"
#include "vm/actor/codes.hpp"
#include "vm/actor/impl/invoker_impl.hpp"

namespace fibon::node {
  using vm::actor::InvokerImpl;
  using vm::actor::MethodNumber;
  using vm::actor::MethodParams;
  namespace builtin = vm::actor::builtin;
  namespace multisig = builtin::multisig;
  namespace token = builtin::token;
  namespace vesting = builtin::vesting;

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("sim")};
      return logger;
    }

    outcome::result<Address> account(Genesis &genesis,
                                     const std::string &name) {
      auto it{genesis.accounts.find(name)};
      if (it != genesis.accounts.end()) {
        return it->second;
      }
      OUTCOME_TRY(address, genesis.env->createAccount(0));
      genesis.accounts.emplace(name, address);
      logger()->info("account {} is {}", name, address);
      return address;
    }

    /// Submits transaction of multisig and approves it up to threshold
    template <typename M>
    outcome::result<void> propose(Genesis &genesis,
                                  const std::vector<Address> &signers,
                                  size_t threshold,
                                  const Address &to,
                                  const typename M::Params &params) {
      OUTCOME_TRY(encoded, vm::actor::encodeActorParams(params));
      OUTCOME_TRY(submitted,
                  applyMethod<multisig::Submit>(
                      *genesis.env,
                      signers[0],
                      genesis.multisig,
                      {to, 0, M::Number, encoded}));
      auto applied{submitted.applied};
      auto code{submitted.code};
      for (size_t i{1}; i < threshold; ++i) {
        OUTCOME_TRY(approved,
                    applyMethod<multisig::Approve>(*genesis.env,
                                                   signers[i],
                                                   genesis.multisig,
                                                   {submitted.tx_id}));
        applied = approved.applied;
        code = approved.code;
      }
      if (!applied || code != vm::VMExitCode::kOk) {
        logger()->error("multisig transaction {} calling method {} of {} "
                        "failed with exit code {}",
                        submitted.tx_id,
                        M::Number,
                        to,
                        static_cast<int64_t>(code));
        return GenesisError::kTransactionNotExecuted;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<Genesis> buildGenesis(const Config &config) {
    Genesis genesis;
    genesis.genesis_time = config.genesis_time
                               ? *config.genesis_time
                               : clock::SystemClock{}.now().count();
    genesis.clock = std::make_shared<clock::ManualClock>(
        clock::UnixTime{genesis.genesis_time});
    OUTCOME_TRYA(genesis.env,
                 Env::make(std::make_shared<InvokerImpl>(), genesis.clock));
    auto &env{*genesis.env};

    std::vector<Address> signers;
    for (const auto &owner : config.owners) {
      OUTCOME_TRY(address, account(genesis, owner));
      signers.push_back(address);
    }

    OUTCOME_TRY(multisig_params,
                vm::actor::encodeActorParams(
                    multisig::Construct::Params{signers, config.threshold}));
    OUTCOME_TRYA(genesis.multisig,
                 env.deployActor(builtin::kMultisigCodeId,
                                 multisig_params,
                                 config.treasury));
    OUTCOME_TRY(
        token_params,
        vm::actor::encodeActorParams(token::Construct::Params{genesis.multisig}));
    OUTCOME_TRYA(genesis.token,
                 env.deployActor(builtin::kTokenCodeId, token_params, 0));
    OUTCOME_TRY(vesting_params,
                vm::actor::encodeActorParams(vesting::Construct::Params{
                    genesis.token, genesis.multisig}));
    OUTCOME_TRYA(genesis.vesting,
                 env.deployActor(builtin::kVestingCodeId, vesting_params, 0));
    logger()->info("multisig {}, token {}, vesting {}",
                   genesis.multisig,
                   genesis.token,
                   genesis.vesting);

    if (config.mint > 0) {
      OUTCOME_TRY(propose<token::Mint>(genesis,
                                       signers,
                                       config.threshold,
                                       genesis.token,
                                       {genesis.vesting, config.mint}));
    }

    for (const auto &type : config.vesting_types) {
      OUTCOME_TRY(propose<vesting::AddVestingType>(genesis,
                                                   signers,
                                                   config.threshold,
                                                   genesis.vesting,
                                                   {type.id, type.phases}));
    }

    if (!config.schedules.empty()) {
      vesting::CreateVestingSchedules::Params batch;
      for (const auto &schedule : config.schedules) {
        OUTCOME_TRY(beneficiary, account(genesis, schedule.beneficiary));
        batch.entries.push_back({beneficiary,
                                 schedule.type_id,
                                 schedule.amount,
                                 genesis.genesis_time});
      }
      OUTCOME_TRY(propose<vesting::CreateVestingSchedules>(
          genesis, signers, config.threshold, genesis.vesting, batch));
    }

    return genesis;
  }
}  // namespace fibon::node

OUTCOME_CPP_DEFINE_CATEGORY(fibon::node, GenesisError, e) {
  using fibon::node::GenesisError;
  switch (e) {
    case GenesisError::kMessageFailed:
      return "GenesisError: message failed";
    case GenesisError::kTransactionNotExecuted:
      return "GenesisError: multisig transaction not executed";
  }
  return "GenesisError: unknown error";
}
