#include <cerrno> // for errno, EINTR
#include <charconv> // for std::from_chars
#include <cstring> // for std::strerror
#include <exception> // for std::exception
#include <fstream>
#include <functional> // for std::function
#include <iomanip> // for std::quoted, std::setw
#include <iostream>
#include <map>
#include <memory> // for std::unique_ptr
#include <optional>
#include <span>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <system_error> // for std::errc
#include <vector>

#include <histedit.h>

#include "airnet/errors.hpp"
#include "airnet/model.hpp"
#include "airnet/reader.hpp"
#include "airnet/utility.hpp"

namespace {

using arguments = std::vector<std::string>;
using string_span = std::span<const std::string>;

using cmd_handler = std::function<void(const string_span& args)>;
using cmd_table = std::map<std::string, cmd_handler>;

constexpr auto shell_name = "airnet";

const auto help_argument = std::string{"--help"};
const auto usage_argument = std::string{"--usage"};
const auto verbose_argument = std::string{"--verbose"};
const auto verbose_short_argument = std::string{"-v"};
const auto interactive_argument = std::string{"--interactive"};
const auto interactive_short_argument = std::string{"-i"};

constexpr auto emacs_editor_str = "emacs";
constexpr auto vi_editor_str = "vi";
constexpr auto pressure_str = "pressure";
constexpr auto temperature_str = "temperature";
constexpr auto pdrop_str = "pdrop";

/// @brief Makes the stated return type from given argument count and vector.
/// @param[in] ac Argument count.
/// @param[in] av Argument vector.
auto make_arguments(int ac, const char*av[]) -> arguments
{
    auto args = arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct HistoryDeleter
{
    void operator()(History *p)
    {
        history_end(p);
    }
};

using history_ptr = std::unique_ptr<History, HistoryDeleter>;

struct TokenizerDeleter
{
    void operator()(Tokenizer *p)
    {
        tok_end(p);
    }
};

using tokenizer_ptr = std::unique_ptr<Tokenizer, TokenizerDeleter>;

auto continuation = false;

char *prompt([[maybe_unused]] EditLine *el)
{
    static auto nl_prefix = std::string{"\1\033[7m\1"};
    static auto nl_suffix = std::string{"$\1\033[0m\1 "};
    static auto nl_buf = nl_prefix + shell_name + nl_suffix;
    static auto cl_buf = std::string{shell_name} + "> ";
    return continuation? cl_buf.data(): nl_buf.data();
}

auto to_double(const std::string_view& view) -> std::optional<double>
{
    auto value = 0.0;
    const auto last = data(view) + size(view);
    const auto [ptr, ec] = std::from_chars(data(view), last, value);
    if ((ptr != last) || (ec != std::errc())) {
        return {};
    }
    return value;
}

auto print_usage(std::ostream& os, const string_span& args,
                 const std::string_view& syntax = {}) -> void
{
    os << "usage: ";
    os << args[0];
    os << " [";
    os << help_argument;
    os << '|';
    os << usage_argument;
    os << ']';
    if (!empty(syntax)) {
        os << ' ' << syntax;
    }
    os << "\n";
}

/// @brief Handles the help and usage arguments common to every command.
/// @return <code>true</code> if handled, <code>false</code> otherwise.
auto handle_common(const string_span& args, const std::string_view& help,
                   const std::string_view& syntax = {}) -> bool
{
    for (auto&& arg: args.subspan(1u)) {
        if (arg == help_argument) {
            std::cout << help << "\n";
            return true;
        }
        if (arg == usage_argument) {
            print_usage(std::cout, args, syntax);
            return true;
        }
    }
    return false;
}

auto find_link(const airnet::model& model, const std::string& key)
    -> const airnet::link*
{
    if (key.empty()) {
        return nullptr;
    }
    return airnet::find_link(model, airnet::name{key});
}

auto do_summary(const airnet::model& model, const string_span& args) -> void
{
    if (handle_common(args, "summarizes the network model.")) {
        return;
    }
    airnet::summarize(std::cout, model);
}

auto do_nodes(const airnet::model& model, const string_span& args) -> void
{
    if (handle_common(args, "shows the nodes of the network model.",
                      "[<node-name>...]")) {
        return;
    }
    if (size(args) == 1u) {
        for (auto&& entry: model.nodes) {
            std::cout << entry.second << "\n";
        }
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        const auto found = arg.empty()?
            nullptr: airnet::find_node(model, airnet::name{arg});
        if (!found) {
            std::cerr << std::quoted(arg) << ": no such node\n";
            continue;
        }
        std::cout << *found << "\n";
    }
}

auto do_links(const airnet::model& model, const string_span& args) -> void
{
    if (handle_common(args, "shows the links of the network model.",
                      "[<link-name>...]")) {
        return;
    }
    if (size(args) == 1u) {
        for (auto&& l: model.links) {
            std::cout << l << "\n";
        }
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        const auto found = find_link(model, arg);
        if (!found) {
            std::cerr << std::quoted(arg) << ": no such link\n";
            continue;
        }
        std::cout << *found << "\n";
    }
}

auto do_elements(const airnet::model& model, const string_span& args)
    -> void
{
    if (handle_common(args, "shows the elements of the network model.")) {
        return;
    }
    for (auto&& entry: model.elements) {
        std::cout << entry.first << ": " << entry.second << "\n";
    }
}

auto do_set(airnet::model& model, const string_span& args) -> void
{
    constexpr auto syntax =
        "<node-name> pressure|temperature <value>";
    if (handle_common(args, "sets a node's pressure (Pa) or temperature (K).",
                      syntax)) {
        return;
    }
    if (size(args) != 4u) {
        print_usage(std::cerr, args, syntax);
        return;
    }
    const auto found = args[1].empty()?
        nullptr: airnet::find_node(model, airnet::name{args[1]});
    if (!found) {
        std::cerr << std::quoted(args[1]) << ": no such node\n";
        return;
    }
    const auto value = to_double(args[3]);
    if (!value) {
        std::cerr << std::quoted(args[3]) << ": not a number\n";
        return;
    }
    if (args[2] == pressure_str) {
        found->pressure = *value;
    }
    else if (args[2] == temperature_str) {
        if (*value <= 0.0) {
            std::cerr << "temperature must be greater than zero\n";
            return;
        }
        found->temperature = *value;
    }
    else {
        print_usage(std::cerr, args, syntax);
        return;
    }
    airnet::set_properties(*found);
}

auto do_calc(const airnet::model& model, const string_span& args) -> void
{
    constexpr auto syntax = "<link-name> [<pressure-drop>]";
    if (handle_common(args, "calculates the flow through a link.", syntax)) {
        return;
    }
    if ((size(args) < 2u) || (size(args) > 3u)) {
        print_usage(std::cerr, args, syntax);
        return;
    }
    const auto found = find_link(model, args[1]);
    if (!found) {
        std::cerr << std::quoted(args[1]) << ": no such link\n";
        return;
    }
    auto pdrop = airnet::pressure_drop(model, *found);
    if (size(args) == 3u) {
        const auto value = to_double(args[2]);
        if (!value) {
            std::cerr << std::quoted(args[2]) << ": not a number\n";
            return;
        }
        pdrop = *value;
    }
    std::cout << pdrop_str << "=" << pdrop << " ";
    std::cout << airnet::calculate(model, *found, pdrop) << "\n";
}

auto do_linearize(const airnet::model& model, const string_span& args)
    -> void
{
    constexpr auto syntax = "<link-name>";
    if (handle_common(args, "shows the initial flow slope of a link.",
                      syntax)) {
        return;
    }
    if (size(args) != 2u) {
        print_usage(std::cerr, args, syntax);
        return;
    }
    const auto found = find_link(model, args[1]);
    if (!found) {
        std::cerr << std::quoted(args[1]) << ": no such link\n";
        return;
    }
    std::cout << airnet::linearize(model, *found) << "\n";
}

auto do_history(history_ptr& hist, int& hist_size, const string_span& args)
    -> void
{
    if (handle_common(args, "shows the history of commands entered.",
                      "[clear]")) {
        return;
    }
    HistEvent ev{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg == "clear") {
            history(hist.get(), &ev, H_CLEAR);
            return;
        }
    }
    const auto width = static_cast<int>(std::to_string(hist_size).size());
    for (auto rv = history(hist.get(), &ev, H_LAST);
         rv != -1;
         rv = history(hist.get(), &ev, H_PREV)) {
         std::cout << std::setw(width) << ev.num << " " << ev.str;
    }
}

auto do_editor(edit_line_ptr& el, const string_span& args) -> void
{
    if (handle_common(args, "shows or sets the shell editor.", "[vi|emacs]")) {
        return;
    }
    for (auto&& arg: args.subspan(1u)) {
        if ((arg == vi_editor_str) || (arg == emacs_editor_str)) {
            el_set(el.get(), EL_EDITOR, arg.c_str());
        }
    }
    if (size(args) == 1u) {
        auto ptr = static_cast<const char *>(nullptr);
        el_get(el.get(), EL_EDITOR, &ptr);
        if (!ptr) {
            std::cerr << "unable to get current shell editor\n";
            return;
        }
        std::cout << "shell editor is currently ";
        std::cout << std::quoted(ptr);
        std::cout << '\n';
    }
}

auto do_help(const cmd_table& cmds, const string_span& args) -> void
{
    using strings = std::vector<std::string>;
    if (size(args) > 1u) {
        if (handle_common(args, "provides help on builtin airnet commands.",
                          "[<builtin-command-name>...]")) {
            return;
        }
        for (auto&& arg: args.subspan(1u)) {
            const auto found = cmds.find(arg);
            if (found == cmds.end()) {
                std::cerr << std::quoted(arg);
                std::cerr << ": unknown command, skipping\n";
                continue;
            }
            std::cout << found->first;
            std::cout << ": ";
            const auto cargs = strings{found->first, help_argument};
            found->second(cargs);
        }
        return;
    }
    for (auto&& entry: cmds) {
        std::cout << entry.first;
        std::cout << ": ";
        const auto cargs = strings{entry.first, help_argument};
        entry.second(cargs);
    }
}

auto run(const cmd_handler& cmd, const string_span& args) -> void
{
    try {
        cmd(args);
    }
    catch (const std::exception& ex) {
        std::cerr << "exception caught from running ";
        std::cerr << args[0];
        std::cerr << " command: ";
        std::cerr << ex.what();
        std::cerr << "\n";
    }
}

auto print_program_usage(std::ostream& os, const char* program) -> void
{
    os << "usage: " << program;
    os << " [" << verbose_short_argument << '|' << verbose_argument << "]";
    os << " [" << interactive_short_argument << '|';
    os << interactive_argument << "]";
    os << " NETWORK_FILE\n";
}

auto load(const std::string& path, std::ostream& diags)
    -> std::optional<airnet::model>
{
    diags << "Opening input file " << std::quoted(path) << "...\n";
    auto file = std::ifstream{path};
    if (!file) {
        const auto err = errno;
        std::cerr << shell_name << ": cannot open " << std::quoted(path);
        std::cerr << ": " << std::strerror(err) << "\n";
        return {};
    }
    try {
        diags << "Reading input file " << std::quoted(path) << "...\n";
        const auto records = airnet::read_network(file);
        return airnet::make_model(records, diags);
    }
    catch (const airnet::bad_network_input& ex) {
        std::cerr << path << ":" << ex.line << ": " << ex.what() << "\n";
    }
    catch (const std::invalid_argument& ex) {
        std::cerr << path << ": " << ex.what() << "\n";
    }
    return {};
}

auto interact(const char* program, airnet::model& model) -> void
{
    auto do_loop = true;
    auto hist_size = 100;

    // For example of using libedit, see: https://tinyurl.com/3ez9utzc
    HistEvent ev{};
    auto hist = history_ptr{history_init()};
    history(hist.get(), &ev, H_SETSIZE, hist_size);

    auto tok = tokenizer_ptr{tok_init(NULL)};

    auto el = edit_line_ptr{el_init(program, stdin, stdout, stderr)};
    el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
    el_set(el.get(), EL_HIST, history, hist.get());
    el_set(el.get(), EL_PROMPT_ESC, prompt, '\1');
    el_set(el.get(), EL_EDITOR, emacs_editor_str);
    el_source(el.get(), NULL);

    const cmd_table cmds{
        {"exit", [&](const string_span& args){
            if (handle_common(args, "exits this shell.")) {
                return;
            }
            do_loop = false;
        }},
        {"help", [&](const string_span& args){
            if (size(args) == 1u) {
                std::cout << "Builtin airnet commands:\n\n";
            }
            do_help(cmds, args);
        }},
        {"editor", [&](const string_span& args){
            do_editor(el, args);
        }},
        {"history", [&](const string_span& args){
            do_history(hist, hist_size, args);
        }},
        {"summary", [&](const string_span& args){
            do_summary(model, args);
        }},
        {"nodes", [&](const string_span& args){
            do_nodes(model, args);
        }},
        {"links", [&](const string_span& args){
            do_links(model, args);
        }},
        {"elements", [&](const string_span& args){
            do_elements(model, args);
        }},
        {"set", [&](const string_span& args){
            do_set(model, args);
        }},
        {"calc", [&](const string_span& args){
            do_calc(model, args);
        }},
        {"linearize", [&](const string_span& args){
            do_linearize(model, args);
        }},
    };

    while (do_loop) {
        auto count = 0;
        const auto buf = el_gets(el.get(), &count);
        if (!buf || count == 0) {
            const auto err = errno;
            if (err == EINTR) {
                std::cerr << "el_gets was interrupted\n";
                continue;
            }
            if (count != 0) {
                std::cerr << "aborting: el_gets returned null, count=";
                std::cerr << count;
                std::cerr << ", error=";
                std::cerr << std::strerror(err);
                std::cerr << "\n";
            }
            break;
        }
        if (!continuation && (count == 1)) {
            continue;
        }
        const auto li = el_line(el.get());
        auto ac = 0; // arg count
        auto av = static_cast<const char**>(nullptr);
        auto cc = 0;
        auto co = 0;
        const auto tok_line_rv = tok_line(tok.get(), li, &ac, &av, &cc, &co);
        if (tok_line_rv == -1) {
            std::cerr << "Internal error\n";
            continuation = false;
            continue;
        }
        const auto hist_rv = history(hist.get(), &ev,
                                     continuation? H_APPEND: H_ENTER, buf);
        if (hist_rv == -1) {
            std::cerr << "history error (" << ev.num << ")" << ev.str << "\n";
        }
        continuation = tok_line_rv > 0;
        if (continuation) {
            continue;
        }
        if (ac < 1 || !av) {
            tok_reset(tok.get());
            continue;
        }
        const auto args = make_arguments(ac, av);
        if (const auto it = cmds.find(args[0]); it != cmds.end()) {
            run(it->second, args);
        }
        else if (el_parse(el.get(), ac, av) == -1) {
            std::cerr << "unrecognized command " << av[0] << "\n";
            std::cerr << "enter " << std::quoted("help") << " for help.\n";
        }
        tok_reset(tok.get());
    }
}

}

auto main(int argc, const char * argv[]) -> int
{
    auto verbose = false;
    auto interactive = false;
    auto path = std::optional<std::string>{};
    for (auto i = 1; i < argc; ++i) {
        const auto arg = std::string{argv[i]};
        if (arg == help_argument) {
            print_program_usage(std::cout, argv[0]);
            std::cout << "Summarizes an airflow network description and";
            std::cout << " optionally explores it interactively.\n";
            return 0;
        }
        if ((arg == verbose_argument) || (arg == verbose_short_argument)) {
            verbose = true;
            continue;
        }
        if ((arg == interactive_argument) ||
            (arg == interactive_short_argument)) {
            interactive = true;
            continue;
        }
        if (arg.starts_with('-') || path) {
            std::cerr << shell_name << ": unexpected argument ";
            std::cerr << std::quoted(arg) << "\n";
            print_program_usage(std::cerr, argv[0]);
            return 1;
        }
        path = arg;
    }
    if (!path) {
        print_program_usage(std::cerr, argv[0]);
        return 1;
    }
    auto& diags = verbose? std::cerr: airnet::null_ostream();
    auto model = load(*path, diags);
    if (!model) {
        return 1;
    }
    airnet::summarize(std::cout, *model);
    if (interactive) {
        interact(argv[0], *model);
    }
    return 0;
}
