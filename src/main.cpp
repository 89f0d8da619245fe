#include "base32.h"
#include "config.h"
#include "counter.h"
#include "logger.h"
#include "totp.h"

#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

namespace {

void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [-c config.json] [--at UNIX_SECONDS]\n"
              << "       " << prog << " --encode ASCII_SECRET\n"
              << "Without -c the secret comes from TOTP_SECRET (and TOTP_ALGORITHM,\n"
              << "TOTP_DIGITS, TOTP_PERIOD, TOTP_FORMAT, TOTP_LOG_LEVEL).\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::optional<long long> at;
    std::optional<std::string> encode;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if ((!std::strcmp(a, "-c") || !std::strcmp(a, "--config")) && i + 1 < argc) {
            config_path = argv[++i];
        } else if (!std::strcmp(a, "--at") && i + 1 < argc) {
            const std::string text = argv[++i];
            std::size_t pos = 0;
            try {
                at = std::stoll(text, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (pos == 0 || pos != text.size()) {
                std::cerr << "--at expects unix seconds, got '" << text << "'\n";
                return 1;
            }
        } else if (!std::strcmp(a, "--encode") && i + 1 < argc) {
            encode = argv[++i];
        } else if (!std::strcmp(a, "-h") || !std::strcmp(a, "--help")) {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (encode) {
        std::cout << base32_encode(*encode) << "\n";
        return 0;
    }

    Logger log("totpgen");

    std::optional<Config> cfg;
    try {
        cfg = config_path.empty() ? Config::from_env() : Config::load_from_file(config_path);
    } catch (const std::exception& e) {
        log.error(std::string("config: ") + e.what());
        return 1;
    }
    log.set_level(cfg->log_level());

    try {
        TOTP totp(cfg->secret(), cfg->digits(), cfg->period(), cfg->algo(), cfg->format());

        // one clock read for both the code and the remaining time
        const UnixSeconds tp = at ? UnixSeconds(std::chrono::seconds(*at))
                                  : to_unix_seconds(std::chrono::system_clock::now());

        log.debug_fmt("algo=", algo_name(totp.algo()), " digits=", totp.digits(),
                      " period=", totp.period().count(), "s format=", format_name(totp.format()),
                      " counter=", totp.counter_at(tp));

        const std::string code = totp.code_at(tp);
        std::cout << code << "\n";
        log.info("valid for " + std::to_string(seconds_remaining(tp, totp.period()).count()) + "s");
    } catch (const std::exception& e) {
        log.error(std::string("generate: ") + e.what());
        return 2;
    }
    return 0;
}
