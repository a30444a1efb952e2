// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <wallet/address.h>
#include <wallet/chains.h>
#include <wallet/crypter.h>
#include <wallet/session_manager.h>
#include <wallet/wallet_manager.h>
#include <wallet/wallet_store.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef _WIN32
    #include <termios.h>
    #include <unistd.h>
#endif

#define COLOR_RESET   "\033[0m"
#define COLOR_RED     "\033[31m"
#define COLOR_GREEN   "\033[32m"
#define COLOR_YELLOW  "\033[33m"
#define COLOR_CYAN    "\033[36m"
#define COLOR_BOLD    "\033[1m"

namespace {

struct CliConfig {
    std::string datadir;
    std::string command;
    std::vector<std::string> args;
    TxParams tx;

    bool ParseArgs(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            try {
                if (arg.find("--datadir=") == 0) {
                    datadir = arg.substr(10);
                } else if (arg.find("--to=") == 0) {
                    tx.to = arg.substr(5);
                } else if (arg.find("--value=") == 0) {
                    tx.value = arg.substr(8);
                } else if (arg.find("--nonce=") == 0) {
                    tx.nonce = std::stoull(arg.substr(8));
                } else if (arg.find("--gasprice=") == 0) {
                    tx.gas_price = std::stoull(arg.substr(11));
                } else if (arg.find("--gaslimit=") == 0) {
                    tx.gas_limit = std::stoull(arg.substr(11));
                } else if (arg.find("--chainid=") == 0) {
                    tx.chain_id = std::stoull(arg.substr(10));
                } else if (arg.find("--data=") == 0) {
                    if (!ParseHexArg(arg.substr(7), tx.data)) {
                        std::cerr << "Error: --data is not valid hex" << std::endl;
                        return false;
                    }
                } else if (arg.find("--payload=") == 0) {
                    if (!ParseHexArg(arg.substr(10), tx.payload)) {
                        std::cerr << "Error: --payload is not valid hex" << std::endl;
                        return false;
                    }
                } else if (arg == "--help" || arg == "-h") {
                    return false;
                } else if (arg.find("--") == 0) {
                    std::cerr << "Error: Unknown option: " << arg << std::endl;
                    return false;
                } else if (command.empty()) {
                    command = arg;
                } else {
                    args.push_back(arg);
                }
            } catch (const std::invalid_argument&) {
                std::cerr << "Error: Invalid number in " << arg << std::endl;
                return false;
            } catch (const std::out_of_range&) {
                std::cerr << "Error: Number out of range in " << arg << std::endl;
                return false;
            }
        }
        return !command.empty();
    }

    static bool ParseHexArg(const std::string& value, std::vector<uint8_t>& out) {
        std::string hex = value;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            hex = hex.substr(2);
        }
        if (!IsHex(hex)) {
            return false;
        }
        out = ParseHex(hex);
        return true;
    }

    void PrintUsage(const char* program) const {
        std::cout << "Polyvault - multi-chain wallet key manager" << std::endl;
        std::cout << std::endl;
        std::cout << "Usage: " << program << " [options] <command> [args]" << std::endl;
        std::cout << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  create <name>                 Create a wallet with a new 24-word phrase" << std::endl;
        std::cout << "  recover <name>                Restore a wallet from a recovery phrase" << std::endl;
        std::cout << "  list                          List stored wallets" << std::endl;
        std::cout << "  show <id>                     Show addresses and derivation paths" << std::endl;
        std::cout << "  rename <id> <name>            Change a wallet's display name" << std::endl;
        std::cout << "  passwd <id>                   Change a wallet's password" << std::endl;
        std::cout << "  delete <id>                   Delete a stored wallet" << std::endl;
        std::cout << "  sign <id> <chain>             Unlock and sign one transaction" << std::endl;
        std::cout << "  validateaddress <chain> <a>   Check an address for a chain" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --datadir=<path>      Data directory (default: ~/.polyvault)" << std::endl;
        std::cout << "  --to=<0x...>          EVM recipient (omit for contract creation)" << std::endl;
        std::cout << "  --value=<wei>         EVM value as a decimal string" << std::endl;
        std::cout << "  --nonce=<n>           EVM nonce" << std::endl;
        std::cout << "  --gasprice=<wei>      EVM gas price" << std::endl;
        std::cout << "  --gaslimit=<n>        EVM gas limit" << std::endl;
        std::cout << "  --chainid=<n>         EVM chain id (default: chain's own id)" << std::endl;
        std::cout << "  --data=<hex>          EVM call data" << std::endl;
        std::cout << "  --payload=<hex>       BTC sighash or SOL/TON message bytes" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << std::endl;
        std::cout << "Chains: BSC, BTC, ETH, POLYGON, SOL, TON" << std::endl;
        std::cout << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Configuration file: polyvault.conf (in data directory)" << std::endl;
        std::cout << "  Environment variables: POLYVAULT_* (e.g., POLYVAULT_SESSIONTIMEOUT=600)" << std::endl;
    }
};

void PrintMessage(const std::string& message, const std::string& type) {
    if (type == "SUCCESS") {
        std::cout << COLOR_GREEN << "✓ " << message << COLOR_RESET << std::endl;
    } else if (type == "ERROR") {
        std::cerr << COLOR_RED << "✗ " << message << COLOR_RESET << std::endl;
    } else if (type == "WARNING") {
        std::cout << COLOR_YELLOW << "⚠ " << message << COLOR_RESET << std::endl;
    } else {
        std::cout << COLOR_CYAN << "ℹ " << message << COLOR_RESET << std::endl;
    }
}

void PrintSuccess(const std::string& message) { PrintMessage(message, "SUCCESS"); }
void PrintError(const std::string& message) { PrintMessage(message, "ERROR"); }
void PrintWarning(const std::string& message) { PrintMessage(message, "WARNING"); }

void PrintWalletError(WalletError err, const std::string& detail) {
    std::string message = GetWalletErrorMessage(err);
    if (!detail.empty() && detail != message) {
        message += " (" + detail + ")";
    }
    PrintError(message);
}

bool PromptConfirmation(const std::string& message) {
    std::cout << COLOR_YELLOW << message << " (y/n): " << COLOR_RESET;
    std::string response;
    std::getline(std::cin, response);
    return (response == "y" || response == "Y" || response == "yes" || response == "Yes");
}

/**
 * Read one line from stdin with terminal echo disabled
 */
std::string PromptSecret(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    std::string secret;
#ifndef _WIN32
    termios old_term;
    bool restore = false;
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_term) == 0) {
        termios new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        restore = (tcsetattr(STDIN_FILENO, TCSANOW, &new_term) == 0);
    }
    std::getline(std::cin, secret);
    if (restore) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
        std::cout << std::endl;
    }
#else
    std::getline(std::cin, secret);
#endif
    return secret;
}

void Cleanse(std::string& secret) {
    memory_cleanse(&secret[0], secret.size());
    secret.clear();
}

/**
 * Ask twice for a new password; empty on mismatch
 */
std::string PromptNewPassword() {
    std::string password = PromptSecret("New password: ");
    std::string confirm = PromptSecret("Confirm password: ");
    if (password != confirm) {
        Cleanse(password);
        PrintError("Passwords do not match");
    }
    Cleanse(confirm);
    return password;
}

void PrintMnemonicSecurityWarning() {
    std::cout << std::endl;
    std::cout << COLOR_RED << COLOR_BOLD << "╔══════════════════════════════════════════════════════════════╗" << COLOR_RESET << std::endl;
    std::cout << COLOR_RED << COLOR_BOLD << "║              CRITICAL SECURITY WARNING                       ║" << COLOR_RESET << std::endl;
    std::cout << COLOR_RED << COLOR_BOLD << "╚══════════════════════════════════════════════════════════════╝" << COLOR_RESET << std::endl;
    std::cout << std::endl;
    std::cout << COLOR_YELLOW << "Your recovery phrase is the ONLY way to restore this wallet on every chain." << COLOR_RESET << std::endl;
    std::cout << "  ✓ Write it down on paper and keep it offline" << std::endl;
    std::cout << "  ✗ Never store it in a file, email or photo" << std::endl;
    std::cout << "  ✗ Never share it with anyone" << std::endl;
    std::cout << std::endl;
}

void PrintRecord(const CWalletRecord& record) {
    std::cout << COLOR_BOLD << record.name << COLOR_RESET << "  (" << record.id << ")" << std::endl;
    for (const auto& entry : record.addresses) {
        std::cout << "  " << entry.first << ": " << entry.second;
        auto path = record.derivation_paths.find(entry.first);
        if (path != record.derivation_paths.end()) {
            std::cout << "  [" << path->second << "]";
        }
        std::cout << std::endl;
    }
}

int CmdCreate(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 1) {
        PrintError("Usage: create <name>");
        return 1;
    }

    std::string password = PromptNewPassword();
    if (password.empty()) {
        return 1;
    }

    std::string mnemonic;
    std::string error;
    CWalletRecord record;
    WalletError err = manager.CreateWallet(config.args[0], password, mnemonic, record, error);
    Cleanse(password);
    if (err != WalletError::OK) {
        PrintWalletError(err, error);
        return 1;
    }

    PrintMnemonicSecurityWarning();
    std::cout << COLOR_BOLD << mnemonic << COLOR_RESET << std::endl;
    std::cout << std::endl;
    Cleanse(mnemonic);

    PrintSuccess("Wallet created");
    PrintRecord(record);
    manager.Lock();
    return 0;
}

int CmdRecover(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 1) {
        PrintError("Usage: recover <name>");
        return 1;
    }

    std::string mnemonic = PromptSecret("Recovery phrase: ");
    std::string password = PromptNewPassword();
    if (password.empty()) {
        Cleanse(mnemonic);
        return 1;
    }

    std::string error;
    CWalletRecord record;
    WalletError err = manager.RecoverWallet(mnemonic, config.args[0], password, record, error);
    Cleanse(mnemonic);
    Cleanse(password);
    if (err != WalletError::OK) {
        PrintWalletError(err, error);
        return 1;
    }

    PrintSuccess("Wallet recovered");
    PrintRecord(record);
    manager.Lock();
    return 0;
}

int CmdList(CWalletManager& manager) {
    std::vector<CWalletSummary> wallets;
    WalletError err = manager.ListWallets(wallets);
    if (err != WalletError::OK) {
        PrintWalletError(err, "");
        return 1;
    }

    if (wallets.empty()) {
        PrintMessage("No wallets stored", "INFO");
        return 0;
    }
    for (const CWalletSummary& wallet : wallets) {
        std::cout << wallet.id << "  " << wallet.name << std::endl;
    }
    return 0;
}

int CmdShow(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 1) {
        PrintError("Usage: show <id>");
        return 1;
    }

    CWalletRecord record;
    WalletError err = manager.GetWallet(config.args[0], record);
    if (err != WalletError::OK) {
        PrintWalletError(err, "");
        return 1;
    }
    PrintRecord(record);
    return 0;
}

int CmdRename(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 2) {
        PrintError("Usage: rename <id> <name>");
        return 1;
    }

    std::string error;
    WalletError err = manager.RenameWallet(config.args[0], config.args[1], error);
    if (err != WalletError::OK) {
        PrintWalletError(err, error);
        return 1;
    }
    PrintSuccess("Wallet renamed");
    return 0;
}

int CmdPasswd(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 1) {
        PrintError("Usage: passwd <id>");
        return 1;
    }

    std::string old_password = PromptSecret("Current password: ");
    std::string new_password = PromptNewPassword();
    if (new_password.empty()) {
        Cleanse(old_password);
        return 1;
    }

    std::string error;
    WalletError err = manager.ChangePassword(config.args[0], old_password, new_password, error);
    Cleanse(old_password);
    Cleanse(new_password);
    if (err != WalletError::OK) {
        PrintWalletError(err, error);
        return 1;
    }
    PrintSuccess("Password changed");
    return 0;
}

int CmdDelete(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 1) {
        PrintError("Usage: delete <id>");
        return 1;
    }

    PrintWarning("Deleting a wallet cannot be undone without its recovery phrase.");
    if (!PromptConfirmation("Delete wallet " + config.args[0] + "?")) {
        PrintMessage("Cancelled", "INFO");
        return 1;
    }

    WalletError err = manager.DeleteWallet(config.args[0]);
    if (err != WalletError::OK) {
        PrintWalletError(err, "");
        return 1;
    }
    PrintSuccess("Wallet deleted");
    return 0;
}

int CmdSign(CWalletManager& manager, const CliConfig& config) {
    if (config.args.size() != 2) {
        PrintError("Usage: sign <id> <chain> [transaction options]");
        return 1;
    }

    std::string password = PromptSecret("Password: ");
    std::future<WalletError> unlock = manager.UnlockAsync(config.args[0], password);
    Cleanse(password);

    WalletError err = unlock.get();
    if (err != WalletError::OK) {
        PrintWalletError(err, "");
        return 1;
    }

    std::vector<uint8_t> signed_bytes;
    std::string error;
    err = manager.SignTransaction(config.args[1], config.tx, signed_bytes, error);
    manager.Lock();
    if (err != WalletError::OK) {
        PrintWalletError(err, error);
        return 1;
    }

    std::cout << HexStr(signed_bytes) << std::endl;
    return 0;
}

int CmdValidateAddress(const CliConfig& config) {
    if (config.args.size() != 2) {
        PrintError("Usage: validateaddress <chain> <address>");
        return 1;
    }

    Chain chain;
    if (!ParseChain(config.args[0], chain)) {
        PrintError("Unsupported chain: " + config.args[0]);
        return 1;
    }

    std::string error;
    if (!ValidateAddress(chain, config.args[1], error)) {
        PrintError("Invalid " + ChainToString(chain) + " address: " + error);
        return 1;
    }
    PrintSuccess("Valid " + ChainToString(chain) + " address");
    return 0;
}

bool InitLogging(const WalletOptions& options) {
    CLoggingConfig& log_config = CLoggingConfig::GetInstance();

    LogLevel level;
    if (CLoggingConfig::ParseLogLevel(options.log_level, level)) {
        log_config.SetLogLevel(level);
    }
    log_config.SetConsoleLogging(options.print_to_console);
    if (!options.log_file.empty()) {
        log_config.SetLogFile(options.log_file);
    }
    return CLogger::GetInstance().Initialize(options.datadir);
}

} // namespace

int main(int argc, char* argv[]) {
    CliConfig config;
    if (!config.ParseArgs(argc, argv)) {
        config.PrintUsage(argv[0]);
        return 1;
    }

    if (config.command == "validateaddress") {
        return CmdValidateAddress(config);
    }

    // Priority: Command-line > Environment > Config file > Default
    std::string initial_datadir = config.datadir.empty() ? GetDefaultDataDir() : config.datadir;
    std::string config_file = GetConfigFilePath(initial_datadir);
    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(config_file)) {
        std::cerr << "ERROR: Failed to load configuration file: " << config_file << std::endl;
        return 1;
    }

    WalletOptions options;
    std::string error;
    if (!LoadWalletOptions(config_parser, options, error)) {
        std::cerr << "ERROR: Invalid configuration: " << error << std::endl;
        return 1;
    }
    if (!config.datadir.empty()) {
        options.datadir = config.datadir;
    }

    try {
        std::filesystem::create_directories(options.datadir);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "ERROR: Cannot create data directory " << options.datadir << ": " << e.what() << std::endl;
        return 1;
    }

    if (!InitLogging(options)) {
        std::cerr << "WARNING: File logging disabled" << std::endl;
    }

    CLevelDBStorage storage;
    if (!storage.Open(options.datadir + "/wallets", error)) {
        std::cerr << "ERROR: Failed to open wallet database: " << error << std::endl;
        CLogger::GetInstance().Shutdown();
        return 1;
    }

    int result = 1;
    {
        CSessionManager session(std::make_shared<CSystemClock>(), options.session_timeout);
        CWalletManager manager(storage, session, options);

        if (config.command == "create") {
            result = CmdCreate(manager, config);
        } else if (config.command == "recover") {
            result = CmdRecover(manager, config);
        } else if (config.command == "list") {
            result = CmdList(manager);
        } else if (config.command == "show") {
            result = CmdShow(manager, config);
        } else if (config.command == "rename") {
            result = CmdRename(manager, config);
        } else if (config.command == "passwd") {
            result = CmdPasswd(manager, config);
        } else if (config.command == "delete") {
            result = CmdDelete(manager, config);
        } else if (config.command == "sign") {
            result = CmdSign(manager, config);
        } else {
            PrintError("Unknown command: " + config.command);
            config.PrintUsage(argv[0]);
        }

        manager.Lock();
    }

    storage.Close();
    CLogger::GetInstance().Shutdown();
    return result;
}
