#pragma once

#include "progress_display.h"
#include "terminal.h"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <core/auth/token_store.h>
#include <core/model/agent_info.h>
#include <core/network/client/agent_client.h>
#include <core/network/discovery/discovery_client.h>
#include <memory>
#include <string>
#include <vector>

namespace deckhand::cli {

// Hub front end commands. Network work runs on the io_context, which another
// thread must be running; every command blocks until its work is done.
class HubCommands {
public:
    HubCommands(boost::asio::io_context& io_context,
                core::TokenStore& tokens,
                core::DiscoveryClient& discovery,
                Terminal& terminal);

    // Returns the process exit code
    int Execute(const std::string& command, const std::vector<std::string>& args);

    void RunInteractive();

private:
    void discover();
    void pair(const std::string& key);
    void info(const std::string& key);
    void shortcuts(const std::string& key, const std::string& user_id);
    void deploy(const std::string& key,
                const std::string& dir,
                const std::string& name,
                const std::string& exe);
    void revoke(const std::string& key);
    void printHelp();

    // Matches an agent id or name, browsing once when it is not known yet
    core::DiscoveredAgent resolve(const std::string& key);

    // Connects with the stored token; throws when the agent is not paired
    std::shared_ptr<core::AgentClient> connect(const core::DiscoveredAgent& agent);

    std::shared_ptr<core::AgentClient> makeClient() const;

    template <typename F>
    auto run(F&& f) {
        return boost::asio::co_spawn(io_context_, std::forward<F>(f), boost::asio::use_future).get();
    }

    boost::asio::io_context& io_context_;
    core::TokenStore& tokens_;
    core::DiscoveryClient& discovery_;
    Terminal& terminal_;
    ProgressDisplay progress_display_;
};

} // namespace deckhand::cli
