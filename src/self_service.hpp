#pragma once

#include <string>
#include <vector>

// Privileged operations on the installer itself. They bypass the trust gate.
class SelfService {
public:
    virtual ~SelfService() = default;

    // Runs a freshly fetched installer script. Throws HotpackException when it fails.
    virtual void run_update_script(const std::string& script) = 0;

    // Replaces the running installer with a fresh copy of itself.
    virtual void restart() = 0;
};

// Options carried over to the restarted installer. The command is never
// carried over, so a restart always comes back up as the console.
struct LaunchOptions {
    std::string root;
    std::string platform;
    std::string api_url;
    bool no_safe_mode = false;
};

std::vector<std::string> restart_arguments(const std::string& program, const LaunchOptions& options);

class ProcessSelfService : public SelfService {
public:
    explicit ProcessSelfService(std::vector<std::string> argv);

    void run_update_script(const std::string& script) override;
    void restart() override;

private:
    std::vector<std::string> argv_;
};
