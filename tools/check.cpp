//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// pathrules-check: validate the rule files of a
// site and show how request paths resolve.

#include <pathrules.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace logging = boost::log;

namespace {

void
set_log_level(bool verbose)
{
    logging::core::get()->set_filter(
        logging::trivial::severity >= (verbose ?
            logging::trivial::debug :
            logging::trivial::info));
}

void
print_resolution(
    pathrules::rule_engine const& eng,
    std::string const& path)
{
    if(auto r = eng.resolve_redirect(path))
    {
        std::cout <<
            path << " -> " << r->status << " " << r->location;
        if(pathrules::statuses::is_permanent(r->status))
            std::cout << " (permanent)";
        std::cout << "\n";
        return;
    }
    auto const fields = eng.resolve_headers(path);
    if(fields.empty())
    {
        std::cout << path << ": no rule\n";
        return;
    }
    for(auto const& f : fields)
        std::cout <<
            path << ": " << f.name << ": " << f.value << "\n";
}

} // (anon)

int
main(int argc, char** argv)
{
    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "show this message")
        ("verbose,v", "log debug messages")
        ("default-status", po::value<int>()->default_value(302),
            "status of redirects which do not give one (1-999)");

    po::options_description hidden;
    hidden.add_options()
        ("site", po::value<std::string>()->required(),
            "site root directory")
        ("path", po::value<std::vector<std::string>>(),
            "request paths to resolve");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description pos;
    pos.add("site", 1).add("path", -1);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv)
            .options(all).positional(pos).run(), vm);
        if(vm.count("help"))
        {
            std::cout <<
                "Usage: pathrules-check [options] <site-dir> [path...]\n" <<
                visible;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
        auto const status = vm["default-status"].as<int>();
        if(status < 1 || status > 999)
            throw po::validation_error(
                po::validation_error::invalid_option_value,
                "default-status",
                std::to_string(status));
    }
    catch(po::error const& e)
    {
        std::cerr <<
            "pathrules-check: " << e.what() << "\n" <<
            "Usage: pathrules-check [options] <site-dir> [path...]\n" <<
            visible;
        return EXIT_FAILURE;
    }

    set_log_level(vm.count("verbose") != 0);

    pathrules::parse_options opts;
    opts.default_status = static_cast<unsigned>(
        vm["default-status"].as<int>());

    std::shared_ptr<pathrules::rule_set const> rs;
    try
    {
        rs = pathrules::load_rules(
            vm["site"].as<std::string>(), opts);
    }
    catch(pathrules::config_error const& e)
    {
        std::cerr <<
            e.file() << ":" << e.line() << ": " <<
            e.code().message() << "\n";
        return EXIT_FAILURE;
    }

    pathrules::rule_engine eng(std::move(rs));
    if(vm.count("path"))
        for(auto const& p : vm["path"].as<std::vector<std::string>>())
            print_resolution(eng, p);
    return EXIT_SUCCESS;
}
