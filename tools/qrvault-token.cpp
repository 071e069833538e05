/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2024, Regents of the University of California.
 *
 * This file is part of qrvault, an optical one-time-token guard for a secret vault.
 *
 * qrvault is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * qrvault is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * qrvault, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of qrvault authors and contributors.
 */

#include "token-generator.hpp"
#include "detail/guard-configuration.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <chrono>
#include <cstring>
#include <iostream>

namespace qrvault {

static boost::asio::io_context ioCtx;

static void
handleSignal(const boost::system::error_code& error, int signalNum)
{
  if (error) {
    return;
  }
  const char* signalName = ::strsignal(signalNum);
  std::cerr << "\nExiting on signal ";
  if (signalName == nullptr) {
    std::cerr << signalNum;
  }
  else {
    std::cerr << signalName;
  }
  std::cerr << std::endl;
  ioCtx.stop();
}

static void
printRotation(const std::string& proof, time::seconds remaining, bool isStatic)
{
  std::cout << "Token: " << proof << std::endl;
  if (isStatic) {
    std::cout << "Static token, never rotates" << std::endl;
  }
  else {
    std::cout << "Refreshing token in: " << remaining.count() << "s" << std::endl;
  }
}

static void
scheduleTick(boost::asio::steady_timer& timer, TokenGenerator& generator)
{
  timer.expires_after(std::chrono::seconds(1));
  timer.async_wait([&timer, &generator] (const boost::system::error_code& error) {
    if (error) {
      return;
    }
    auto now = time::system_clock::now();
    auto proof = generator.pollRotation(now);
    if (proof) {
      std::cout << "\nToken: " << *proof << std::endl;
    }
    std::cout << "\rRefreshing token in: " << generator.getTimeUntilRotation(now).count() << "s "
              << std::flush;
    scheduleTick(timer, generator);
  });
}

static int
main(int argc, char* argv[])
{
  std::string configFilePath(QRVAULT_SYSCONFDIR "/qrvault/guard.conf");
  std::string secret;
  int64_t period = DEFAULT_PERIOD.count();
  bool wantWatch = false;

  namespace po = boost::program_options;
  po::options_description optsDesc("Options");
  optsDesc.add_options()
  ("help,h", "print this help message and exit")
  ("config-file,c", po::value<std::string>(&configFilePath)->default_value(configFilePath), "path to configuration file")
  ("secret,s", po::value<std::string>(&secret), "shared secret, overrides the configuration file")
  ("period,p", po::value<int64_t>(&period)->default_value(period), "rotation period in seconds, used with --secret")
  ("watch,w", po::bool_switch(&wantWatch), "keep running and show each new token");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, optsDesc), vm);
    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }
  catch (const boost::bad_any_cast& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  if (vm.count("help") != 0) {
    std::cout << "Usage: " << argv[0] << " [options]\n"
              << "\n"
              << optsDesc;
    return 0;
  }

  std::optional<TokenGenerator> generator;
  try {
    if (vm.count("secret") != 0) {
      generator.emplace(SharedSecret(secret.begin(), secret.end()), time::seconds(period));
    }
    else {
      GuardConfig config;
      config.load(configFilePath);
      generator.emplace(config.makeTokenGenerator());
    }
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  auto now = time::system_clock::now();
  auto proof = generator->pollRotation(now);
  BOOST_ASSERT(proof);
  printRotation(*proof, generator->getTimeUntilRotation(now), generator->isStatic());
  if (!wantWatch || generator->isStatic()) {
    return 0;
  }

  boost::asio::signal_set terminateSignals(ioCtx);
  terminateSignals.add(SIGINT);
  terminateSignals.add(SIGTERM);
  terminateSignals.async_wait(handleSignal);

  boost::asio::steady_timer timer(ioCtx);
  scheduleTick(timer, *generator);
  ioCtx.run();
  return 0;
}

} // namespace qrvault

int
main(int argc, char* argv[])
{
  return qrvault::main(argc, argv);
}
