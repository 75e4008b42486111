/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <boost/program_options/errors.hpp>
#include <iostream>

#include "clock/time.hpp"
#include "common/logger.hpp"
#include "node/main/builder.hpp"
#include "vm/actor/builtin/token/token_actor.hpp"
#include "vm/actor/builtin/vesting/vesting_actor.hpp"

namespace fibon {
  namespace vesting = vm::actor::builtin::vesting;
  namespace token = vm::actor::builtin::token;
  using node::callMethod;
  using node::Config;
  using node::Genesis;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("sim");
      return logger.get();
    }

    /// Prints vesting progress of every schedule at genesis + offset
    outcome::result<void> report(const Config &config,
                                 Genesis &genesis,
                                 primitives::Duration offset) {
      const auto time{genesis.genesis_time + offset};
      OUTCOME_TRY(genesis.clock->setTime(clock::UnixTime{time}));
      log()->info("report at {} (+{}s)",
                  clock::unixTimeToString(clock::UnixTime{time}),
                  offset);
      for (const auto &schedule : config.schedules) {
        const auto &beneficiary{genesis.accounts.at(schedule.beneficiary)};
        OUTCOME_TRY(amount,
                    callMethod<vesting::GetVestedAmount>(*genesis.env,
                                                         beneficiary,
                                                         genesis.vesting,
                                                         {beneficiary}));
        OUTCOME_TRY(percentage,
                    callMethod<vesting::GetVestedPercentage>(*genesis.env,
                                                             beneficiary,
                                                             genesis.vesting,
                                                             {beneficiary}));
        log()->info("  {} ({}): vested {} ({}.{:02}%), released {}, "
                    "releasable {}",
                    schedule.beneficiary,
                    beneficiary,
                    amount.vested.str(),
                    percentage / 100,
                    percentage % 100,
                    amount.released.str(),
                    amount.releasable.str());
      }
      OUTCOME_TRY(total,
                  callMethod<vesting::GetTotalAllocated>(
                      *genesis.env, genesis.multisig, genesis.vesting, {}));
      OUTCOME_TRY(custody,
                  callMethod<token::BalanceOf>(*genesis.env,
                                               genesis.multisig,
                                               genesis.token,
                                               {genesis.vesting}));
      log()->info("  total allocated {}, custody {}", total.str(), custody.str());
      return outcome::success();
    }

    outcome::result<void> main(const Config &config) {
      OUTCOME_TRY(genesis, node::buildGenesis(config));
      log()->info("genesis at {}",
                  clock::unixTimeToString(clock::UnixTime{genesis.genesis_time}));
      auto offsets{config.report_at};
      std::sort(offsets.begin(), offsets.end());
      for (const auto &offset : offsets) {
        OUTCOME_TRY(report(config, genesis, offset));
      }
      return outcome::success();
    }
  }  // namespace
}  // namespace fibon

int main(int argc, char *argv[]) {
  fibon::node::Config config;
  try {
    config = fibon::node::Config::read(argc, argv);
  } catch (const boost::program_options::error &e) {
    std::cerr << "Cannot parse options: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  fibon::common::configureLogging(
      config.log_level, config.log_file ? config.log_file->string() : "");

  if (auto result{fibon::main(config)}; !result) {
    fibon::log()->error("simulation failed: {}", result.error().message());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
