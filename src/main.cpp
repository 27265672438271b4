/***
 * Name: agentrun::main
 * Purpose: Entry point for the agentrun CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: POSIX process status code (0 on completed run).
 * Theory of Operation:
 *   Delegates to RunCli with the process streams; anything escaping it is an
 *   internal error reported with status 2.
 */
#include <exception>
#include <iostream>

#include "agentrun/driver/app.h"
#include "agentrun/exceptions/agentrun_exception.h"

int main(int argc, char** argv) {
  try {
    return agentrun::driver::RunCli(argc, argv, std::cout, std::cerr);
  } catch (const agentrun::exceptions::AgentrunException& ex) {
    std::cerr << "agentrun: " << ex.what() << '\n';
    return agentrun::driver::kExitUsage;
  } catch (const std::exception& ex) {
    std::cerr << "agentrun: internal error: " << ex.what() << '\n';
    return agentrun::driver::kExitUsage;
  }
}
