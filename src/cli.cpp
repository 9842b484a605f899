#include <iostream>

#include <boost/program_options.hpp>

#include <splice/config.h>
#include <splice/encodings/json.h>
#include <splice/encodings/yaml.h>
#include <splice/fs/file_io.h>
#include <splice/patch/apply.h>
#include <splice/patch/source.h>

using namespace splicer;

static std::vector<named_document>
load_documents(std::vector<string> const& paths)
{
    std::vector<named_document> documents;
    for (auto const& path : paths)
    {
        auto contents = read_file_contents(path);
        dynamic_array loaded;
        if (file_path(path).extension() == ".json")
            loaded.push_back(parse_json_value(contents));
        else
            loaded = parse_yaml_documents(contents);
        for (auto& document : loaded)
        {
            auto named = make_named_document(std::move(document));
            get_logger()->debug(
                "loaded {} from {}", get_qualified_name(named), path);
            documents.push_back(std::move(named));
        }
    }
    return documents;
}

// Split a "key=value" option.
static std::pair<string, string>
split_assignment(string const& option, string const& default_value)
{
    auto equals = option.find('=');
    if (equals == string::npos)
        return std::make_pair(option, default_value);
    return std::make_pair(option.substr(0, equals), option.substr(equals + 1));
}

static void
report_failures(std::vector<patch_failure> const& failures)
{
    for (auto const& failure : failures)
        std::cerr << "error: patch " << failure << "\n";
}

static string
write_documents(
    std::vector<named_document> const& documents, output_format format)
{
    dynamic_array contents;
    for (auto const& document : documents)
        contents.push_back(document.content);
    if (format == output_format::JSON)
    {
        return value_to_json(
                   contents.size() == 1 ? contents.front() : dynamic(contents))
               + "\n";
    }
    return value_to_yaml_documents(contents);
}

static int
run(boost::program_options::variables_map const& vm)
{
    optional<file_path> config_path;
    if (vm.count("config-file"))
        config_path = file_path(vm["config-file"].as<string>());
    else
        config_path = find_config_file();

    splice_config config;
    if (config_path)
        config = read_config_file(*config_path);

    // Command-line options override the config file.
    if (vm.count("graceful"))
        config.graceful = true;
    if (vm.count("format"))
        config.output_format = vm["format"].as<string>();
    if (vm.count("set"))
    {
        for (auto const& option : vm["set"].as<std::vector<string>>())
        {
            auto assignment = split_assignment(option, "");
            config.values.insert_or_assign(
                assignment.first, parse_yaml_scalar(assignment.second));
        }
    }
    if (vm.count("feature"))
    {
        for (auto const& option : vm["feature"].as<std::vector<string>>())
        {
            auto assignment = split_assignment(option, "true");
            auto value = parse_yaml_scalar(assignment.second);
            if (value.type() != value_type::BOOLEAN)
            {
                std::cerr << "error: --feature " << option
                          << ": expected true or false\n";
                return 1;
            }
            config.features[assignment.first] = cast<bool>(value);
        }
    }

    auto logging = get_logging_config(config);
    if (vm.count("debug"))
        logging.level = spdlog::level::debug;
    initialize_logging(logging);

    auto format = config.output_format
                      ? parse_output_format(*config.output_format)
                      : output_format::YAML;

    auto documents = load_documents(
        vm.count("base") ? vm["base"].as<std::vector<string>>()
                         : std::vector<string>());

    if (vm.count("list"))
    {
        for (auto const& document : documents)
            std::cout << document.kind << "/" << document.name << "\n";
        return 0;
    }

    std::vector<patch_op> patches;
    if (vm.count("patch"))
    {
        auto variables = get_variable_context(config);
        for (auto const& path : vm["patch"].as<std::vector<string>>())
        {
            auto loaded = read_patch_file(path, variables);
            get_logger()->info("loaded {} patch(es) from {}", loaded.size(), path);
            patches.insert(patches.end(), loaded.begin(), loaded.end());
        }
    }

    if (vm.count("validate"))
    {
        auto report = validate_patches(documents, patches);
        report_failures(report.failures);
        std::cout << report.applied_count << " of " << patches.size()
                  << " patch(es) would apply\n";
        return succeeded(report) ? 0 : 1;
    }

    apply_options options;
    options.graceful = config.graceful.value_or(false);
    auto report = apply_patches(documents, patches, options);
    get_logger()->info(
        "applied {} of {} patch(es)", report.applied_count, patches.size());

    auto output = write_documents(documents, format);
    if (vm.count("output"))
        dump_string_to_file(vm["output"].as<string>(), output);
    else
        std::cout << output;

    // Graceful runs still write what applied, then fail on the rest.
    check_apply_report(report);
    return 0;
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    // clang-format off
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(),
            "specify the configuration file to use")
        ("base", po::value<std::vector<string>>(),
            "a YAML or JSON file of documents to patch (repeatable)")
        ("patch", po::value<std::vector<string>>(),
            "a patch file to apply (repeatable, applied in order)")
        ("output", po::value<string>(),
            "write the patched documents to this file instead of stdout")
        ("format", po::value<string>(), "output format: yaml or json")
        ("validate", "check the patches without writing anything")
        ("list", "list the loaded documents")
        ("graceful", "apply what can be applied and report the rest")
        ("debug", "enable debug logging")
        ("set", po::value<std::vector<string>>(),
            "set a ${values.<key>} variable (key=value)")
        ("feature", po::value<std::vector<string>>(),
            "set a ${features.<flag>} variable (flag[=true|false])")
    ;
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << "error: " << e.what() << "\n" << desc;
        return 1;
    }

    if (vm.count("help"))
    {
        std::cout << desc;
        return 0;
    }

    try
    {
        return run(vm);
    }
    catch (aggregate_parse_error& e)
    {
        auto failures = get_error_info<patch_parse_failures_info>(e);
        if (failures)
            report_failures(*failures);
        else
            std::cerr << "error: " << get_patch_error_message(e) << "\n";
        return 1;
    }
    catch (aggregate_apply_error& e)
    {
        auto failures = get_error_info<patch_apply_failures_info>(e);
        if (failures)
            report_failures(*failures);
        else
            std::cerr << "error: " << get_patch_error_message(e) << "\n";
        return 1;
    }
    catch (target_resolution_error& e)
    {
        std::cerr << "error: " << get_patch_error_message(e) << "\n";
        return 1;
    }
    catch (patch_apply_error& e)
    {
        std::cerr << "error: " << get_patch_error_message(e) << "\n";
        return 1;
    }
    catch (std::exception& e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
