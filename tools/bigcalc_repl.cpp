#include <bigcalc/session.hpp>

#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace {

void print_usage(const char* argv0) {
    fmt::print("usage: {} [-d|--debug] [-p|--prompt] [-h|--help]\n"
               "Reads expressions from standard input, one per line.\n"
               "  -d, --debug   trace lexing and postfix conversion to stderr\n"
               "  -p, --prompt  print a prompt before each line\n"
               "  -h, --help    show this message\n",
               argv0);
}

} // namespace

int main(int argc, char** argv) {
    bigcalc::Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-d" || arg == "--debug") {
            opts.debug = true;
        } else if (arg == "-p" || arg == "--prompt") {
            opts.prompt = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            fmt::print(stderr, "Error: unknown option: {}\n", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    bigcalc::Session session(opts);
    std::string line;

    for (;;) {
        if (opts.prompt) {
            fmt::print("> ");
            std::fflush(stdout);
        }
        if (!std::getline(std::cin, line)) break;

        bigcalc::Reply reply = session.handle(line);
        if (!reply.text.empty()) fmt::print("{}\n", reply.text);
        std::fflush(stdout);
        if (reply.quit) break;
    }

    return 0;
}
