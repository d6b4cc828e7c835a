//
// Copyright (c) 2025 The pathrules authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathrules/site_loader.hpp>
#include <pathrules/header_rule.hpp>
#include <pathrules/statuses.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/generic_category.hpp>
#include <boost/throw_exception.hpp>
#include <cerrno>
#include <fstream>
#include <ios>
#include <iterator>
#include <system_error>

namespace pathrules {

namespace {

std::string
make_what(
    std::string const& file,
    std::size_t line)
{
    if(line == 0)
        return file;
    return file + ":" + std::to_string(line);
}

[[noreturn]]
void
throw_io_error(
    std::filesystem::path const& p,
    int ev)
{
    boost::throw_exception(config_error(
        system::error_code(ev,
            system::generic_category()),
        p.string(), 0), BOOST_CURRENT_LOCATION);
}

// returns an empty string if the file does not exist
std::string
read_if_exists(
    std::filesystem::path const& p)
{
    std::error_code ec;
    auto const st = std::filesystem::status(p, ec);
    if(st.type() == std::filesystem::file_type::not_found)
    {
        BOOST_LOG_TRIVIAL(debug) <<
            p.string() << ": not found, no rules";
        return {};
    }
    if(ec)
        boost::throw_exception(config_error(
            system::error_code(ec), p.string(), 0),
            BOOST_CURRENT_LOCATION);
    if(st.type() == std::filesystem::file_type::directory)
        throw_io_error(p, EISDIR);
    if(st.type() != std::filesystem::file_type::regular)
        throw_io_error(p, EINVAL);

    std::ifstream f(p, std::ios::in | std::ios::binary);
    if(! f)
        throw_io_error(p, errno ? errno : EIO);
    std::string s;
    try
    {
        s.assign(
            std::istreambuf_iterator<char>(f),
            std::istreambuf_iterator<char>());
    }
    catch(std::ios_base::failure const&)
    {
        throw_io_error(p, EIO);
    }
    if(f.bad())
        throw_io_error(p, EIO);
    return s;
}

std::shared_ptr<rule_set const>
build_impl(
    core::string_view headers,
    std::string const& headers_name,
    core::string_view redirects,
    std::string const& redirects_name,
    parse_options const& opts)
{
    std::size_t line = 0;
    auto hv = parse_headers(headers, line);
    if(hv.has_error())
    {
        BOOST_LOG_TRIVIAL(error) <<
            headers_name << ":" << line << ": " <<
            hv.error().message();
        boost::throw_exception(config_error(
            hv.error(), headers_name, line),
            BOOST_CURRENT_LOCATION);
    }

    auto rv = parse_redirects(redirects, opts, line);
    if(rv.has_error())
    {
        BOOST_LOG_TRIVIAL(error) <<
            redirects_name << ":" << line << ": " <<
            rv.error().message();
        boost::throw_exception(config_error(
            rv.error(), redirects_name, line),
            BOOST_CURRENT_LOCATION);
    }

    for(auto const& r : *rv)
    {
        if(! statuses::is_redirect(r.status))
            BOOST_LOG_TRIVIAL(warning) <<
                redirects_name << ": " <<
                r.path.to_string() << " uses status " <<
                r.status << ", which is not a redirect";
    }

    BOOST_LOG_TRIVIAL(debug) <<
        headers_name << ": " << hv->size() << " rules";
    BOOST_LOG_TRIVIAL(debug) <<
        redirects_name << ": " << rv->size() << " rules";

    return std::make_shared<rule_set>(
        std::move(*hv), std::move(*rv));
}

} // (anon)

config_error::
config_error(
    system::error_code const& ec,
    std::string file,
    std::size_t line)
    : system::system_error(ec, make_what(file, line))
    , file_(std::move(file))
    , line_(line)
{
}

std::shared_ptr<rule_set const>
build_rules(
    core::string_view headers,
    core::string_view redirects,
    parse_options const& opts)
{
    return build_impl(
        headers, headers_file_name,
        redirects, redirects_file_name,
        opts);
}

std::shared_ptr<rule_set const>
load_rules(
    std::filesystem::path const& root,
    parse_options const& opts)
{
    std::error_code ec;
    if(! std::filesystem::is_directory(root, ec))
    {
        BOOST_LOG_TRIVIAL(error) <<
            root.string() << ": not a directory";
        boost::throw_exception(config_error(
            ec ? system::error_code(ec) :
                system::errc::make_error_code(
                    system::errc::not_a_directory),
            root.string(), 0), BOOST_CURRENT_LOCATION);
    }

    auto const hp = root / headers_file_name;
    auto const rp = root / redirects_file_name;
    auto const headers = read_if_exists(hp);
    auto const redirects = read_if_exists(rp);
    auto rs = build_impl(
        headers, hp.string(),
        redirects, rp.string(),
        opts);
    BOOST_LOG_TRIVIAL(info) <<
        "loaded rules from " << root.string() << ": " <<
        rs->headers().size() << " header rules, " <<
        rs->redirects().size() << " redirects";
    return rs;
}

} // pathrules
