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

#include "guard.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

namespace qrvault {

static void
printEvent(GuardEvent event, const std::string& detail)
{
  switch (event) {
    case GuardEvent::REJECTED:
      std::cout << "[-] Invalid/expired token: " << detail << std::endl;
      break;
    case GuardEvent::ACCEPTED:
      std::cout << "[+] VALID TOKEN: " << detail << std::endl;
      break;
    case GuardEvent::UNLOCKED:
      std::cout << "[+] SUCCESS: Vault unlocked" << std::endl;
      break;
    case GuardEvent::UNLOCK_FAILED:
      std::cout << "[!] Unlock error: " << detail << std::endl;
      break;
    case GuardEvent::SUPPRESSED:
      break;
  }
}

static void
handleSignal(const boost::system::error_code& error, int signalNum)
{
  if (error) {
    return;
  }
  const char* signalName = ::strsignal(signalNum);
  std::cerr << "Exiting on signal ";
  if (signalName == nullptr) {
    std::cerr << signalNum;
  }
  else {
    std::cerr << signalName;
  }
  std::cerr << std::endl;
  // the main thread is blocked reading standard input
  std::exit(0);
}

static int
main(int argc, char* argv[])
{
  std::string configFilePath(QRVAULT_SYSCONFDIR "/qrvault/guard.conf");
  bool wantSingleShot = false;

  namespace po = boost::program_options;
  po::options_description optsDesc("Options");
  optsDesc.add_options()
  ("help,h", "print this help message and exit")
  ("version,V", "print version information and exit")
  ("config-file,c", po::value<std::string>(&configFilePath)->default_value(configFilePath), "path to configuration file")
  ("single-shot,1", po::bool_switch(&wantSingleShot), "exit after the first successful unlock");

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
              << "Reads decoded optical codes from standard input, one per line.\n"
              << "\n"
              << optsDesc;
    return 0;
  }

  if (vm.count("version") != 0) {
    std::cout << QRVAULT_VERSION_STRING << std::endl;
    return 0;
  }

  GuardConfig config;
  try {
    config.load(configFilePath);
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  if (wantSingleShot) {
    config.isSingleShot = true;
  }

  std::unique_ptr<Guard> guard;
  try {
    guard = std::make_unique<Guard>(std::move(config), nullptr);
  }
  catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }
  guard->setEventCallback(&printEvent);

  std::cerr << "[*] Guard running (" << guard->getConfig().mode << " mode)" << std::endl;

  boost::asio::io_context ioCtx;
  boost::asio::signal_set terminateSignals(ioCtx);
  terminateSignals.add(SIGINT);
  terminateSignals.add(SIGTERM);
  terminateSignals.async_wait(handleSignal);
  std::thread signalThread([&ioCtx] { ioCtx.run(); });

  std::string line;
  while (std::getline(std::cin, line)) {
    // strip the line terminator only; anything else is part of the candidate
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    guard->onCandidate(line);
    if (guard->isFinished()) {
      std::cerr << "[*] Single-shot unlock done, exiting" << std::endl;
      break;
    }
  }

  ioCtx.stop();
  signalThread.join();
  return 0;
}

} // namespace qrvault

int
main(int argc, char* argv[])
{
  return qrvault::main(argc, argv);
}
