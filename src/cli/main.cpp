#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  parcelctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send <text...>\n"
                         "  send-file <path>\n"
                         "  status\n"
                         "  quit\n");
}

// Turns the command words into one daemon request line. Returns an exit code on misuse.
int to_request(const std::vector<std::string> &args, std::string &line)
{
    const std::string &cmd = args[0];
    if (cmd == "send" && args.size() >= 2)
    {
        line = "SEND";
        for (std::size_t i = 1; i < args.size(); ++i)
            line += " " + args[i];
    }
    else if (cmd == "send-file" && args.size() == 2)
    {
        // the daemon resolves paths against its own cwd
        std::error_code ec;
        auto            path = std::filesystem::absolute(ipc::expand_user(args[1]), ec);
        if (ec)
        {
            std::fprintf(stderr, "error: bad path: %s\n", args[1].c_str());
            return exitc::bad_args;
        }
        line = "SENDFILE " + path.string();
    }
    else if (cmd == "status" && args.size() == 1)
        line = "STATUS";
    else if (cmd == "quit" && args.size() == 1)
        line = "QUIT";
    else
    {
        if (cmd != "send" && cmd != "send-file" && cmd != "status" && cmd != "quit")
            std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    if (line.find('\n') != std::string::npos)
    {
        std::fprintf(stderr, "error: command line must not contain newline characters\n");
        return exitc::bad_args;
    }
    return exitc::ok;
}

}  // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args;
    std::string              sock_opt;  // --sock overrides PARCELLINK_CTL_SOCK and the default
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
            sock_opt = argv[++i];
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::string line;
    if (int rc = to_request(args, line); rc != exitc::ok)
        return rc;

    const std::string sock =
        ipc::expand_user(sock_opt.empty() ? constants::ctl_sock_path() : sock_opt);
    LOG_DEBUG("request to %s: %s", sock.c_str(), line.c_str());

    std::string reply;
    if (!ipc::request(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    std::printf("%s\n", reply.c_str());
    return reply.rfind("ERR", 0) == 0 ? exitc::failed : exitc::ok;
}
