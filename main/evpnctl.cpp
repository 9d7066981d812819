#include "config/ConfigRegistry.hpp"
#include "crypto/SignatureVerifier.hpp"
#include "crypto/cert.hpp"
#include "crypto/errors.hpp"
#include "crypto/pkce.hpp"
#include "log/Registry.hpp"
#include "nm/Controller.hpp"
#include "nm/EventLoop.hpp"
#include "nm/GDBusSignalBus.hpp"
#include "nm/LibnmClient.hpp"
#include "nm/LibnmPluginImporter.hpp"
#include "nm/StateObserver.hpp"
#include "storage/ConnectionStore.hpp"

#include <paths.hpp>

#include <glib-unix.h>
#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace evpn;

namespace {

constexpr auto USAGE =
    "Usage: evpnctl <command> [args]\n"
    "\n"
    "Commands:\n"
    "  verify <signature> <file>      check a detached minisign signature\n"
    "  import <ovpn> <key> <cert>     save the profile as the managed connection\n"
    "  activate                       activate the managed connection\n"
    "  deactivate                     deactivate the managed connection\n"
    "  status                         print the managed connection's state\n"
    "  watch                          print VPN state changes until interrupted\n"
    "  pkce                           print a PKCE code verifier and challenge\n"
    "  cn <pem>                       print a certificate's common name\n";

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw std::runtime_error("Failed to open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void requireArgs(const std::vector<std::string>& args, const size_t n) {
    if (args.size() != n) throw std::invalid_argument(std::string("Wrong number of arguments\n\n") + USAGE);
}

int report(const std::string& what, const nm::OpResult& result) {
    if (!result.success) {
        log::Registry::evpn()->error("[evpnctl] {} failed ({}): {}", what, nm::to_string(result.error), result.message);
        return EXIT_FAILURE;
    }
    if (!result.performed) log::Registry::evpn()->info("[evpnctl] {} skipped: {}", what, result.message);
    else log::Registry::evpn()->info("[evpnctl] {} done", what);
    return EXIT_SUCCESS;
}

int cmdVerify(const std::vector<std::string>& args) {
    requireArgs(args, 2);
    const auto anchors = crypto::TrustAnchorSet::fromMinisignKeys(config::ConfigRegistry::get().trust.verify_keys);
    const crypto::SignatureVerifier verifier(anchors);
    std::cout << verifier.validate(slurp(args[0]), slurp(args[1]));
    return EXIT_SUCCESS;
}

void requireNetworkManager() {
    if (!nm::LibnmClient::available()) throw std::runtime_error("NetworkManager is not running");
}

struct Session {
    nm::GLibEventLoop loop;
    nm::LibnmClient client;
    nm::LibnmPluginImporter boundary;
    nm::ProfileImporter importer;
    storage::FileConnectionStore store;
    nm::Controller controller;

    Session()
        : boundary(config::ConfigRegistry::get().nm.vpn_plugin),
          importer(boundary, config::ConfigRegistry::get().nm.profile_file_name),
          store(config::ConfigRegistry::get().stateFile()),
          controller(client, importer, store, loop, retryPolicy(), config::ConfigRegistry::get().nm.persist_connections) {}

    static nm::RetryPolicy retryPolicy() {
        const auto& cnf = config::ConfigRegistry::get().activation;
        return {cnf.retry_delay, cnf.max_retries, true};
    }
};

int cmdImport(const std::vector<std::string>& args) {
    requireArgs(args, 3);
    const auto config = slurp(args[0]);
    const auto key = slurp(args[1]);
    const auto cert = slurp(args[2]);

    requireNetworkManager();
    Session s;
    return report("import", nm::runWithMainLoop(s.loop, [&](nm::Completion done) {
        s.controller.saveConnection(config, key, cert, std::move(done));
    }));
}

int cmdActivate(const std::vector<std::string>& args) {
    requireArgs(args, 0);
    requireNetworkManager();
    Session s;
    return report("activate", nm::runWithMainLoop(s.loop, [&](nm::Completion done) {
        s.controller.activate(std::move(done));
    }));
}

int cmdDeactivate(const std::vector<std::string>& args) {
    requireArgs(args, 0);
    requireNetworkManager();
    Session s;
    return report("deactivate", nm::runWithMainLoop(s.loop, [&](nm::Completion done) {
        s.controller.deactivate(std::move(done));
    }));
}

int cmdStatus(const std::vector<std::string>& args) {
    requireArgs(args, 0);
    requireNetworkManager();
    nm::LibnmClient client;
    nm::GDBusSignalBus bus;
    const nm::StateObserver observer(client, bus);

    const auto [uuid, state] = observer.poll();
    const auto [vpnState, reason] = observer.vpnStatus();
    std::cout << "uuid:   " << uuid.value_or("-") << '\n'
              << "state:  " << (state ? nm::to_string(*state) : "-") << '\n'
              << "vpn:    " << nm::to_string(vpnState) << " (" << nm::to_string(reason) << ")\n";
    return EXIT_SUCCESS;
}

gboolean onQuitSignal(gpointer data) {
    log::Registry::evpn()->info("[evpnctl] Signal received, stopping watch");
    static_cast<nm::GLibEventLoop*>(data)->quit();
    return G_SOURCE_REMOVE;
}

gboolean onHangup(gpointer) {
    log::Registry::evpn()->info("[evpnctl] SIGHUP received, reopening log file");
    log::Registry::reopenMainLog();
    return G_SOURCE_CONTINUE;
}

int cmdWatch(const std::vector<std::string>& args) {
    requireArgs(args, 0);
    requireNetworkManager();
    nm::GLibEventLoop loop;
    nm::LibnmClient client;
    nm::GDBusSignalBus bus;
    nm::StateObserver observer(client, bus);

    const auto intId = g_unix_signal_add(SIGINT, onQuitSignal, &loop);
    const auto termId = g_unix_signal_add(SIGTERM, onQuitSignal, &loop);
    const auto hupId = g_unix_signal_add(SIGHUP, onHangup, nullptr);

    observer.subscribe([](const nm::VpnState state, const nm::StateReason reason) {
        std::cout << nm::to_string(state) << " (" << nm::to_string(reason) << ")" << std::endl;
    });
    loop.run();

    observer.unsubscribe();
    g_source_remove(hupId);
    // SIGINT/SIGTERM sources removed themselves if they fired
    if (GSource* src = g_main_context_find_source_by_id(nullptr, intId)) g_source_destroy(src);
    if (GSource* src = g_main_context_find_source_by_id(nullptr, termId)) g_source_destroy(src);
    return EXIT_SUCCESS;
}

int cmdPkce(const std::vector<std::string>& args) {
    requireArgs(args, 0);
    const auto verifier = crypto::pkce::codeVerifier();
    std::cout << "verifier:  " << verifier << '\n'
              << "challenge: " << crypto::pkce::codeChallenge(verifier) << '\n';
    return EXIT_SUCCESS;
}

int cmdCommonName(const std::vector<std::string>& args) {
    requireArgs(args, 1);
    std::cout << crypto::cert::commonName(slurp(args[0])) << '\n';
    return EXIT_SUCCESS;
}

}

int main(const int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) == "help" || std::string(argv[1]) == "--help") {
        std::cout << USAGE;
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    try {
        config::ConfigRegistry::init();
        log::Registry::init(paths::getLogPath());
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize evpnctl: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    const std::string cmd = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (cmd == "verify") return cmdVerify(args);
        if (cmd == "import") return cmdImport(args);
        if (cmd == "activate") return cmdActivate(args);
        if (cmd == "deactivate") return cmdDeactivate(args);
        if (cmd == "status") return cmdStatus(args);
        if (cmd == "watch") return cmdWatch(args);
        if (cmd == "pkce") return cmdPkce(args);
        if (cmd == "cn") return cmdCommonName(args);

        std::cerr << "Unknown command: " << cmd << "\n\n" << USAGE;
        return EXIT_FAILURE;
    } catch (const crypto::BadSignature& e) {
        log::Registry::crypto()->error("[evpnctl] {}", e.what());
    } catch (const crypto::MalformedInput& e) {
        log::Registry::crypto()->error("[evpnctl] Malformed input: {}", e.what());
    } catch (const std::exception& e) {
        log::Registry::evpn()->error("[evpnctl] {} failed: {}", cmd, e.what());
    }
    return EXIT_FAILURE;
}
