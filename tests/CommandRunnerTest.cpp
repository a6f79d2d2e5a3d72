#include <cstdlib>
#include <iostream>
#include <string>

#include "PiNet/System/CommandRunner.hpp"
#include "PiNet/Util/Logger.hpp"
#include "Support/FakeSystem.hpp"

using PiNet::Testing::check;

int main()
{
    int result_code = EXIT_SUCCESS;
    std::cout << "--- PiNet CommandRunner Test ---" << std::endl;
    std::cout << "INFO: Runs /bin/sh; no privileges required." << std::endl;

    PiNet::ProcessRunner runner;
    xtr::sink s = PiNet::logger().get_sink("PiNet CommandRunnerTest");

    // --- Test 1: stdout and stderr are captured separately ---
    std::cout << "\nTEST 1: Capturing output..." << std::endl;
    const auto captured = runner.run({"/bin/sh", "-c", "echo out; echo err >&2"});
    check(captured && captured->ok(), "command exited 0", result_code);
    check(captured && captured->out == "out\n", "stdout captured", result_code);
    check(captured && captured->err == "err\n", "stderr captured", result_code);

    // --- Test 2: Non-zero exit is a result, not an error ---
    std::cout << "\nTEST 2: Non-zero exit status..." << std::endl;
    const auto failed = runner.run({"/bin/sh", "-c", "exit 3"});
    check(failed && failed->exit_code == 3, "exit code 3 reported", result_code);

    const auto checked = PiNet::run_checked(runner, s, {"/bin/sh", "-c", "echo broken >&2; exit 4"});
    check(!checked && checked.error().code == PiNet::ErrorCode::CommandFailed, "run_checked maps exit 4 to CommandFailed",
          result_code);
    check(!checked && checked.error().message.find("broken") != std::string::npos,
          "failure message carries stderr", result_code);

    // --- Test 3: Missing executable ---
    std::cout << "\nTEST 3: Missing executable..." << std::endl;
    const auto missing = runner.run({"/nonexistent/pinet-tool"});
    check(missing && missing->exit_code == 127, "missing executable exits 127", result_code);

    // --- Test 4: Large output does not deadlock ---
    std::cout << "\nTEST 4: Large output on both pipes..." << std::endl;
    const auto large = runner.run({
        "/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"
    });
    check(large && large->ok() && large->out.size() > 100000 && large->err.size() > 100000,
          "both pipes drained", result_code);

    // --- Test 5: Secrets are redacted from logged command lines ---
    std::cout << "\nTEST 5: Command line redaction..." << std::endl;
    const auto shown = PiNet::command_line({"nmcli", "connection", "add", "wifi-sec.psk", "hunter22", "ssid", "x"});
    check(shown.find("hunter22") == std::string::npos && shown.find("******") != std::string::npos,
          "passphrase not shown", result_code);

    // --- Test 6: Child environment ---
    std::cout << "\nTEST 6: Locale and PATH lookup..." << std::endl;
    setenv("LC_ALL", "de_DE.UTF-8", 1);
    setenv("PINET_RUNNER_MARKER", "kept", 1);
    const auto locale = runner.run({"/bin/sh", "-c", "echo \"$LC_ALL $PINET_RUNNER_MARKER\""});
    check(locale && locale->out == "C kept\n", "child runs with LC_ALL=C and the inherited environment",
          result_code);
    const char* parent_locale = std::getenv("LC_ALL");
    check(parent_locale != nullptr && std::string(parent_locale) == "de_DE.UTF-8", "parent environment untouched",
          result_code);
    unsetenv("LC_ALL");
    unsetenv("PINET_RUNNER_MARKER");

    const auto searched = runner.run({"sh", "-c", "echo found"});
    check(searched && searched->ok() && searched->out == "found\n", "bare command name found on PATH",
          result_code);
    const auto unknown = runner.run({"pinet-no-such-tool"});
    check(unknown && unknown->exit_code == 127, "unknown bare name exits 127", result_code);

    std::cout << "\n--- CommandRunner Test Finished ---" << std::endl;
    return result_code;
}
