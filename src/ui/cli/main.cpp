#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "kmslocal/config/StoreConfig.hpp"
#include <CLI/CLI.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    CLI::App app{ "kmsl: local versioned key store" };

    std::string configPath;
    std::string adapterName{ "binary" };
    std::string providerName{ "native" };
    app.add_option("--config", configPath, "JSON store configuration to open on start")->check(CLI::ExistingFile);
    app.add_option("--adapter", adapterName, "Default storage format for create/open")
        ->check(CLI::IsMember(std::vector<std::string>{ "binary", "json", "encrypted", "sqlite" }));
    app.add_option("--provider", providerName, "Crypto provider")
        ->check(CLI::IsMember(std::vector<std::string>{ "native", "openssl" }));

    CLI11_PARSE(app, argc, argv);

    try
    {
        kmslocal::ui::cli::lockProcessMemory();

        std::optional<kmslocal::config::StoreConfig> config{};
        if (!configPath.empty())
        {
            config = kmslocal::config::loadStoreConfig(configPath);
        }

        const auto providerKind{ config ? config->provider : *kmslocal::config::parseProviderKind(providerName) };
        const auto adapterKind{ config ? config->adapter : *kmslocal::config::parseAdapterKind(adapterName) };

        auto crypto{ kmslocal::config::makeCryptoProvider(providerKind) };
        kmslocal::ui::cli::InteractiveShell shell{ *crypto, adapterKind, std::cin, std::cout,
                                                   &kmslocal::ui::cli::readSecret };

        if (config && !shell.openWith(kmslocal::config::toAdapterOptions(*config)))
        {
            return 1;
        }
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
