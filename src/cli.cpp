#include "veil/cli.hpp"
#include "veil/config.hpp"
#include "veil/crypto.hpp"
#include "veil/logging.hpp"
#include "veil/redaction_dispatcher.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>

namespace veil::cli
{

	namespace
	{
		int report(const VeilError &err)
		{
			std::cerr << error_code_to_string(err.code) << ": " << err.what() << std::endl;
			return 1;
		}

		Result<RedactionDispatcher> load_dispatcher(const std::string &config_path)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
				return std::unexpected(cfg.error());

			auto configured = logging::configure(cfg->logging);
			if (!configured)
				return std::unexpected(configured.error());

			return build_dispatcher(*cfg);
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"veil: classified data redaction"};
		app.require_subcommand(0, 1);

		std::string config_path;

		auto cfg_cmd = app.add_subcommand("config-print", "Load a redaction policy and print it as JSON");
		cfg_cmd->add_option("--file", config_path, "Policy TOML path")->required();

		std::string class_name;
		std::string value;
		auto redact_cmd = app.add_subcommand("redact", "Redact a value (or each stdin line) as a data class");
		redact_cmd->add_option("--config", config_path, "Policy TOML path")->required();
		redact_cmd->add_option("--class", class_name, "Data class as taxonomy.class")->required();
		auto value_opt = redact_cmd->add_option("--value", value, "Value to redact; stdin lines when omitted");

		auto describe_cmd = app.add_subcommand("describe", "List registered classes and their fixed output lengths");
		describe_cmd->add_option("--config", config_path, "Policy TOML path")->required();

		std::size_t secret_bytes{32};
		auto secret_cmd = app.add_subcommand("gen-secret", "Generate a random base64 hash secret");
		secret_cmd->add_option("--bytes", secret_bytes, "Secret length in bytes")
			->check(CLI::Range(crypto::KeyedHash::KEY_MIN, crypto::KeyedHash::KEY_MAX));

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::ParseError &e)
		{
			// --help and --version exit 0; every usage error is an input error
			return app.exit(e) == 0 ? 0 : 1;
		}

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				return report(cfg.error());
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*redact_cmd)
		{
			auto class_id = parse_class_id(class_name);
			if (!class_id)
			{
				std::cerr << "Invalid data class (expected taxonomy.class): " << class_name << std::endl;
				return 1;
			}

			auto dispatcher = load_dispatcher(config_path);
			if (!dispatcher)
			{
				return report(dispatcher.error());
			}

			if (*value_opt)
			{
				std::cout << dispatcher->redacted_as(*class_id, value) << std::endl;
				return 0;
			}

			std::string line;
			while (std::getline(std::cin, line))
			{
				std::cout << dispatcher->redacted_as(*class_id, line) << '\n';
			}
			std::cout.flush();
			return 0;
		}

		if (*describe_cmd)
		{
			auto dispatcher = load_dispatcher(config_path);
			if (!dispatcher)
			{
				return report(dispatcher.error());
			}

			for (const auto &class_id : dispatcher->registered_classes())
			{
				std::cout << class_id.to_string();
				if (auto len = dispatcher->exact_len(class_id))
				{
					std::cout << " exact_len=" << *len;
				}
				std::cout << '\n';
			}
			std::cout.flush();
			return 0;
		}

		if (*secret_cmd)
		{
			std::cout << crypto::Base64::encode(crypto::SecureRandom::generate_bytes(secret_bytes)) << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace veil::cli
