/**
 * @file cli_commands.h
 * @brief Subcommand entry points for the chapoly CLI
 *
 * Each handler receives argv with argv[0] set to the subcommand name and
 * returns the process exit code.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef CHAPOLY_CLI_COMMANDS_H
#define CHAPOLY_CLI_COMMANDS_H

int cmd_genkey(int argc, char* argv[]);
int cmd_encrypt(int argc, char* argv[]);
int cmd_decrypt(int argc, char* argv[]);
int cmd_benchmark(int argc, char* argv[]);

#endif // CHAPOLY_CLI_COMMANDS_H
