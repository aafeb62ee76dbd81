#include <breakwater/breaker.h>
#include <breakwater/config.h>
#include <breakwater/environment.h>
#include <breakwater/exceptions.h>
#include <breakwater/logger.h>
#include <breakwater/snapshot.h>
#include <breakwater/util/descriptor.h>
#include <breakwater/util/string.h>
#include <breakwater/visualizer.h>
#include <boost/asio.hpp>
#include <iostream>
#include <random>
#include <string>
#include <unistd.h>
#include <vector>

#ifndef BREAKWATER_VERSION
#define BREAKWATER_VERSION "dev"
#endif

using namespace breakwater;
namespace net = boost::asio;

namespace {

constexpr auto kRefreshInterval = std::chrono::milliseconds(250);
constexpr int kRequestsPerTick = 4;

// Everything below runs on the single io_context thread, which is what keeps
// the breaker free of data races.
struct Session {
    Breaker breaker;
    CliOptions options;
    std::mt19937 rng{std::random_device{}()};

    void draw() {
        const auto now = Clock::now();
        breaker.current_state(now);

        if (options.json) {
            std::cout << to_json(take_snapshot(breaker)) << std::endl;
            return;
        }

        // Clear screen, cursor home
        std::cout << "\x1b[2J\x1b[H" << render(breaker, now, RenderOptions{})
                  << "\n[s] success  [f] failure  [q] quit" << std::endl;
    }

    void generate_traffic() {
        std::bernoulli_distribution fails(options.failure_ratio);
        for (int i = 0; i < kRequestsPerTick; ++i) {
            const auto now = Clock::now();
            if (!breaker.allow_request(now)) {
                continue; // short-circuited, the dependency is not called
            }
            breaker.report_outcome(!fails(rng), now);
        }
    }
};

net::awaitable<void> refresh_loop(Session& session) {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);

    while (true) {
        if (session.options.autoplay) {
            session.generate_traffic();
        }
        session.draw();

        timer.expires_after(kRefreshInterval);
        co_await timer.async_wait(net::use_awaitable);
    }
}

net::awaitable<void> command_loop(net::io_context& ioc, Session& session,
                                  net::posix::stream_descriptor& input) {
    std::string buffer;
    bool quit = false;

    while (true) {
        boost::system::error_code ec;
        const size_t n = co_await net::async_read_until(
            input, net::dynamic_buffer(buffer), '\n',
            net::redirect_error(net::use_awaitable, ec));

        if (ec) {
            if (ec != net::error::eof) {
                Logger::instance().error("stdin: " + ec.message());
            }
            // Without a terminal, auto-play keeps running until a signal arrives
            quit = !session.options.autoplay;
            break;
        }

        const std::string line(util::trim(std::string_view(buffer).substr(0, n - 1)));
        buffer.erase(0, n);

        if (line == "q") {
            quit = true;
            break;
        } else if (line == "s") {
            session.breaker.report_outcome(true);
        } else if (line == "f") {
            session.breaker.report_outcome(false);
        } else if (!line.empty()) {
            Logger::instance().warn("unknown command: " + line);
        }
        session.draw();
    }

    if (quit) ioc.stop();
}

void configure_logging() {
    Logger::instance().configure(env<std::string>("BREAKWATER_LOG", std::string("stdout")));
    Logger::instance().set_level(parse_log_level(env<std::string>("BREAKWATER_LOG_LEVEL", std::string("warn"))));
}

} // namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions options;
    try {
        load_env();
        configure_logging();
        options = parse_cli_options(args, config_from_env());
        if (!options.help && !options.version) {
            validate(options.breaker);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    if (options.help) {
        std::cout << usage() << std::endl;
        return 0;
    }
    if (options.version) {
        std::cout << "v" << BREAKWATER_VERSION << std::endl;
        return 0;
    }

    net::io_context ioc;
    Session session{Breaker(options.breaker), options};

    int stdin_fd = -1;
    try {
        stdin_fd = util::duplicate_descriptor(STDIN_FILENO);
    } catch (const BreakwaterError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    net::posix::stream_descriptor input(ioc, stdin_fd);
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) { ioc.stop(); });

    auto rethrow = [](std::exception_ptr e) {
        if (e) std::rethrow_exception(e);
    };
    net::co_spawn(ioc, refresh_loop(session), rethrow);
    net::co_spawn(ioc, command_loop(ioc, session, input), rethrow);

    try {
        ioc.run();
    } catch (const std::exception& e) {
        Logger::instance().error(e.what());
        Logger::instance().flush();
        return 1;
    }

    Logger::instance().flush();
    return 0;
}
