#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "events/event.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_int(const std::string &s)
{
    if (s.empty())
        return false;
    errno     = 0;
    char *end = nullptr;
    (void)std::strtoll(s.c_str(), &end, 10);
    return end && *end == '\0' && errno != ERANGE;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  ncbridgectl [--sock <path>] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  endpoint-id\n"
                 "  advertise <cb> <name> <service> <adv_medium> <upgrade_medium>\n"
                 "  stop-advertise\n"
                 "  discover <cb> <service> <disc_medium>\n"
                 "  stop-discover\n"
                 "  connect <cb> <name> <endpoint> <conn_medium> <upgrade_medium> <upgrade_type>\n"
                 "          <keep_alive_timeout_ms> <keep_alive_interval_ms>\n"
                 "  accept <cb> <endpoint>\n"
                 "  disconnect <endpoint>\n"
                 "  send <endpoint> <name> <size_kb> [kind] [count]\n"
                 "  stop-all\n"
                 "  cleanup\n"
                 "  wait <cb> <event> <timeout_ms>\n"
                 "  events <cb> <event>\n"
                 "  quit\n");
}

// One command: daemon verb, accepted arg counts, and which args must be integers.
struct CmdInfo
{
    const char      *verb;
    std::size_t      min_args;
    std::size_t      max_args;
    std::vector<int> int_args;  // indices into the command's args
};

static const std::unordered_map<std::string, CmdInfo> &commands()
{
    static const std::unordered_map<std::string, CmdInfo> m = {
        {"endpoint-id", {"GET_LOCAL_ENDPOINT_ID", 0, 0, {}}},
        {"advertise", {"START_ADVERTISING", 5, 5, {3, 4}}},
        {"stop-advertise", {"STOP_ADVERTISING", 0, 0, {}}},
        {"discover", {"START_DISCOVERY", 3, 3, {2}}},
        {"stop-discover", {"STOP_DISCOVERY", 0, 0, {}}},
        {"connect", {"REQUEST_CONNECTION", 8, 8, {3, 4, 5, 6, 7}}},
        {"accept", {"ACCEPT_CONNECTION", 2, 2, {}}},
        {"disconnect", {"DISCONNECT", 1, 1, {}}},
        {"send", {"SEND_PAYLOAD", 3, 5, {2, 3, 4}}},
        {"stop-all", {"STOP_ALL_ENDPOINTS", 0, 0, {}}},
        {"cleanup", {"TRANSFER_FILES_CLEANUP", 0, 0, {}}},
        {"wait", {"EVENT_WAIT", 3, 3, {2}}},
        {"events", {"EVENT_GET_ALL", 2, 2, {}}},
        {"quit", {"QUIT", 0, 0, {}}},
    };
    return m;
}

static int send_request(const std::string &sock, const std::string &line)
{
    std::string reply;
    if (!ipc::request(sock, line, reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    std::printf("%s\n", reply.c_str());
    if (reply.rfind("ERR", 0) == 0)
        return exitc::rpc_error;
    return exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto it = commands().find(cmd);
    if (it == commands().end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    const CmdInfo &info  = it->second;
    const size_t   nargs = args.size() - 1;
    if (nargs < info.min_args || nargs > info.max_args)
    {
        print_usage();
        std::fprintf(stderr, "error: '%s' takes %zu..%zu arguments, got %zu\n", cmd.c_str(),
                     info.min_args, info.max_args, nargs);
        return exitc::bad_args;
    }
    for (int idx : info.int_args)
    {
        if (static_cast<size_t>(idx) >= nargs)
            continue;  // optional arg not given
        const std::string &v = args[1 + idx];
        if (!is_int(v))
        {
            std::fprintf(stderr, "error: expected an integer, got '%s'\n", v.c_str());
            return exitc::bad_args;
        }
    }

    std::string line = info.verb;
    for (size_t i = 1; i < args.size(); ++i)
    {
        line.push_back(' ');
        line += events::escape_token(args[i]);
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return send_line(line);
}
}  // namespace

int main(int argc, char **argv)
{
    if (const char *lv = std::getenv("NCBRIDGE_LOG_LEVEL"))
        ncbridge::set_log_level_by_name(lv);
    else
        ncbridge::set_log_level(ncbridge::Level::Warning);

    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // Allow environment override, then CLI --sock overrides env
    std::string sock;
    if (const char *e = std::getenv("NCBRIDGE_CTL_SOCK"); e && *e)
        sock = ipc::expand_user(e);

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "error: --sock needs a path\n");
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    auto sender = [&](const std::string &line) -> int { return send_request(sock, line); };
    return run_cmd(args[0], args, sender);
}
