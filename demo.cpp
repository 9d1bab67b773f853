// demo.cpp
// Builds the 20-value sample tree, prints it level by level, removes 12
// and prints it again.
//
//   rbset_demo [--no-override] [--trace]
//     --no-override  duplicate inserts keep the stored value
//     --trace        log every rotation (sets the log level to debug)

#include <cstring>
#include <iostream>
#include <vector>

#include "rbset/print_tree.hpp"
#include "rbset/rb_set.hpp"
#include "rbset/trace.hpp"
#include "rbset/util/print.hpp"

namespace
{

    struct DemoConfig
    {
        bool override_mode = true;
        bool trace = false;
    };

    bool parse_args(int argc, char **argv, DemoConfig &config)
    {
        for (int i = 1; i < argc; ++i)
        {
            if (std::strcmp(argv[i], "--no-override") == 0)
                config.override_mode = false;
            else if (std::strcmp(argv[i], "--trace") == 0)
                config.trace = true;
            else
            {
                rbset::util::log(rbset::util::level::error, "unknown argument '{}'", argv[i]);
                return false;
            }
        }
        return true;
    }

} // namespace

int main(int argc, char **argv)
{
    DemoConfig config;
    if (!parse_args(argc, argv, config))
    {
        std::cerr << "usage: " << argv[0] << " [--no-override] [--trace]\n";
        return 2;
    }

    if (config.trace)
        rbset::util::set_log_level(rbset::util::level::debug);

    rbset::RBSet<int> tree(config.override_mode);
    if (config.trace)
        rbset::trace_rotations(tree);

    const std::vector<int> values = {12, 1, 9, 2, 0, 11, 7, 19, 4, 15,
                                     18, 5, 14, 13, 10, 16, 6, 3, 8, 17};
    for (int v : values)
        tree.insert(v);

    rbset::util::println("============== initial tree ({} values) ==============", tree.size());
    std::cout << rbset::format_levels(tree) << '\n';

    tree.remove(12);

    rbset::util::println("============== after removing 12 ({} values) ==============", tree.size());
    std::cout << rbset::format_levels(tree) << '\n';

    const rbset::Violation v = tree.check();
    if (v != rbset::Violation::NONE)
    {
        rbset::util::log(rbset::util::level::error, "invariant check failed: {}", rbset::to_string(v));
        return 1;
    }
    rbset::util::log(rbset::util::level::info, "invariants hold");
    return 0;
}
