/*
    Copyright 2016, Proteus Tech Co Ltd. http://www.kirit.com/
    Distributed under the Boost Software License, Version 1.0.
    See accompanying file LICENSE_1_0.txt or copy at
        http://www.boost.org/LICENSE_1_0.txt
*/


#include <unionmount/configuration.hpp>
#include <unionmount/json.hpp>
#include <unionmount/mount.hpp>
#include <fost/main>


using namespace fostlib;


namespace {
    using source_type = fostlib::string;
    using tag_type = fostlib::string;
    using model_type = std::map<
        std::pair<tag_type, boost::filesystem::path>,
        unionmount::overlays<source_type>>;


    /// Sources are given as `name=path`, or just `path` when the path
    /// can be its own name
    unionmount::source_roots_type from_arguments(fostlib::arguments &args) {
        unionmount::source_roots_type roots;
        for ( std::size_t index = 1; index < args.size(); ++index ) {
            const auto arg = args[index].value().std_str();
            const auto equals = arg.find('=');
            if ( equals == std::string::npos ) {
                roots.emplace(fostlib::string(arg), boost::filesystem::path(arg));
            } else {
                roots.emplace(fostlib::string(arg.substr(0, equals)),
                    boost::filesystem::path(arg.substr(equals + 1)));
            }
        }
        return roots;
    }


    unionmount::transform<model_type> update(
        const unionmount::change<source_type, tag_type> &batch
    ) {
        return [batch](model_type model) {
            for ( const auto &tag : batch ) {
                for ( const auto &file : tag.second ) {
                    const auto key = std::make_pair(tag.first, file.first);
                    if ( file.second.is_delete() ) {
                        model.erase(key);
                    } else {
                        model[key] = file.second.payload();
                    }
                }
            }
            fostlib::log::info(unionmount::c_fost_unionmount)
                ("", "Model updated")
                ("files", model.size());
            return model;
        };
    }
}


FSL_MAIN(
    "union-watch",
    "Union mount watcher\nCopyright 2016, Proteus Tech Co. Ltd."
)( fostlib::ostream &out, fostlib::arguments &args ) {
    const auto sources = args.size() > 1 ? from_arguments(args)
        : unionmount::source_roots(unionmount::c_sources.value());
    if ( sources.empty() ) {
        out << "Specify one or more source directories, either as name=path "
            "or in the unionmount/sources setting" << std::endl;
        return 1;
    }
    const auto patterns = unionmount::tag_patterns_from(unionmount::c_patterns.value());
    const auto ignore = unionmount::ignore_patterns(unionmount::c_ignore.value());

    unionmount::variable<model_type> model;
    unionmount::union_mount_on_variable<source_type, tag_type, model_type>(
        sources, patterns, ignore, model, model_type(),
        [&out](const unionmount::change<source_type, tag_type> &batch) {
            out << fostlib::json::unparse(unionmount::change_json(batch), true)
                << std::endl;
            return update(batch);
        });
    return 0;
}
