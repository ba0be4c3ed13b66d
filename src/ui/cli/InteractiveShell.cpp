#include "InteractiveShell.hpp"
#include "kmslocal/config/StoreConfig.hpp"
#include "kmslocal/core/KeyRecord.hpp"
#include "kmslocal/persistence/AdapterFactory.hpp"
#include "kmslocal/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace kmslocal::ui::cli
{

namespace
{

using kmslocal::core::KeyStoreError;

constexpr std::size_t g_kDefaultKeyBytes{ 32U };
constexpr std::size_t g_kMaxKeyBytes{ 4096U };

void writeHex(std::ostream& out, std::span<const std::uint8_t> bytes)
{
    constexpr std::string_view kHex{ "0123456789abcdef" };
    constexpr unsigned kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };
    for (const std::uint8_t b : bytes)
    {
        out << kHex[(b >> kNibbleShift) & kNibbleMask] << kHex[b & kNibbleMask];
    }
}

[[nodiscard]] bool fileExists(const std::filesystem::path& p)
{
    std::error_code ec{};
    return std::filesystem::exists(p, ec) && !ec;
}

} // namespace

InteractiveShell::InteractiveShell(kmslocal::crypto::ICryptoProvider& crypto,
                                   kmslocal::persistence::AdapterKind defaultKind, std::istream& in, std::ostream& out,
                                   KeyReader keyReader)
    : m_crypto(crypto), m_defaultKind(defaultKind), m_in(in), m_out(out), m_keyReader(std::move(keyReader))
{
}

bool InteractiveShell::openWith(const kmslocal::persistence::AdapterOptions& options)
{
    if (!fileExists(options.path))
    {
        m_adapter = kmslocal::persistence::makeAdapter(options, m_crypto);
        m_out << "New " << kmslocal::persistence::toString(options.kind) << " store at " << options.path.string()
              << " (not saved yet).\n";
        return true;
    }

    auto result = kmslocal::persistence::loadAdapter(options, m_crypto);
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "open store");
        return false;
    }
    m_adapter = std::move(std::get<kmslocal::persistence::AdapterPtr>(result));
    m_out << "Store opened.\n";
    return true;
}

int InteractiveShell::run()
{
    m_out << "kmsl key store shell (CLI11 Powered)\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        if (m_adapter)
        {
            m_out << "kmsl(" << m_adapter->path().filename().string() << ")> ";
        }
        else
        {
            m_out << "kmsl> ";
        }

        if (!std::getline(m_in, line))
        {
            break;
        }

        if (line.find_first_not_of(" \t") == std::string::npos)
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    // A bare 'help' prints the root help, not the help of the 'help' subcommand.
    std::string input{ line };
    const auto first{ input.find_first_not_of(" \t") };
    const auto last{ input.find_first_of(" \t", first) };
    if (input.compare(first, (last == std::string::npos) ? std::string::npos : last - first, "help") == 0)
    {
        input.replace(first, std::string_view{ "help" }.size(), "--help");
    }

    CLI::App app{ "kmsl shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    std::string pathArg;
    std::string kindArg;
    const std::vector<std::string> kinds{ "binary", "json", "encrypted", "sqlite" };

    auto* subCreate = app.add_subcommand("create", "Create a new store file");
    subCreate->add_option("path", pathArg, "Path of the store file")->required();
    subCreate->add_option("--adapter", kindArg, "Storage format")->check(CLI::IsMember(kinds));
    subCreate->callback([&]() { doCreate(pathArg, kindArg); });

    auto* subOpen = app.add_subcommand("open", "Open an existing store file");
    subOpen->add_option("path", pathArg, "Path of the store file")->required();
    subOpen->add_option("--adapter", kindArg, "Storage format")->check(CLI::IsMember(kinds));
    subOpen->callback([&]() { doOpen(pathArg, kindArg); });

    app.add_subcommand("close", "Close the current store without saving")->callback([this]() { doClose(); });
    app.add_subcommand("count", "Print the highest version ever issued")->callback([this]() { doCount(); });
    app.add_subcommand("ls", "List stored versions")->callback([this]() { doList(); });

    std::size_t sizeArg{ g_kDefaultKeyBytes };
    std::string hexArg;
    auto* subAdd = app.add_subcommand("add", "Add a key under the next version (random unless --hex)");
    auto* sizeOpt = subAdd->add_option("--size", sizeArg, "Random key length in bytes")
                        ->check(CLI::Range(std::size_t{ 1U }, g_kMaxKeyBytes));
    auto* hexOpt = subAdd->add_option("--hex", hexArg, "Key bytes as hex");
    sizeOpt->excludes(hexOpt);
    subAdd->callback([&]() {
        doAdd(sizeArg, (hexOpt->count() > 0U) ? std::optional<std::string>{ hexArg } : std::nullopt);
    });

    std::uint64_t versionArg{ 0U };
    auto* subGet = app.add_subcommand("get", "Print the key stored at a version");
    subGet->add_option("version", versionArg, "Version number")->required();
    subGet->callback([&]() { doGet(versionArg); });

    app.add_subcommand("latest", "Print the newest stored key")->callback([this]() { doLatest(); });

    auto* subRm = app.add_subcommand("rm", "Remove the key stored at a version");
    subRm->add_option("version", versionArg, "Version number")->required();
    subRm->callback([&]() { doRm(versionArg); });

    app.add_subcommand("save", "Write the store to disk")->callback([this]() { doSave(); });

    try
    {
        app.parse(input, false);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

// --- Handlers ---

bool InteractiveShell::requireOpen()
{
    if (!m_adapter)
    {
        m_out << "Error: No store open.\n";
        return false;
    }
    return true;
}

void InteractiveShell::reportError(KeyStoreError e, const char* action)
{
    switch (e)
    {
    case KeyStoreError::Poisoned:
        m_out << "Error: Store is poisoned; close and reopen it.\n";
        return;
    case KeyStoreError::AuthenticationFailure:
        m_out << "Error: Wrong key or corrupted store.\n";
        return;
    default:
        m_out << "Error: Failed to " << action << " (" << kmslocal::core::toString(e) << ").\n";
        return;
    }
}

void InteractiveShell::printRecord(const kmslocal::core::VersionedKeyRecord& v)
{
    m_out << "v" << v.version << " created=" << v.record.createdAtUnixSeconds << " bytes=" << v.record.data.size()
          << " ";
    writeHex(m_out, kmslocal::security::asSpan(v.record.data));
    m_out << "\n";
}

std::optional<kmslocal::persistence::AdapterOptions> InteractiveShell::promptOptions(const std::string& path,
                                                                                  const std::string& kindName)
{
    kmslocal::persistence::AdapterOptions options{};
    options.path = path;
    options.kind = m_defaultKind;
    if (!kindName.empty())
    {
        const auto kind{ kmslocal::config::parseAdapterKind(kindName) };
        if (!kind)
        {
            m_out << "Error: Unknown adapter " << kindName << ".\n";
            return std::nullopt;
        }
        options.kind = *kind;
    }

    if (options.kind == kmslocal::persistence::AdapterKind::Encrypted)
    {
        auto hex = m_keyReader("Key (64 hex digits): ");
        auto wipeHex = kmslocal::security::scopeWipe(hex);
        auto key{ kmslocal::config::parseHexKey(kmslocal::security::trimmedView(hex)) };
        if (!key)
        {
            m_out << "Error: Key must be 64 hex digits.\n";
            return std::nullopt;
        }
        options.key = std::move(*key);
    }
    return options;
}

void InteractiveShell::doCreate(const std::string& path, const std::string& kindName)
{
    if (fileExists(path))
    {
        m_out << "Error: Store already exists at " << path << "\n";
        return;
    }

    auto options = promptOptions(path, kindName);
    if (!options)
    {
        return;
    }

    auto adapter = kmslocal::persistence::makeAdapter(*options, m_crypto);
    const auto saved = adapter->save();
    if (const auto* err = std::get_if<KeyStoreError>(&saved))
    {
        reportError(*err, "create store");
        return;
    }
    m_adapter = std::move(adapter);
    m_out << "Store created.\n";
}

void InteractiveShell::doOpen(const std::string& path, const std::string& kindName)
{
    if (!fileExists(path))
    {
        m_out << "Error: Store does not exist at " << path << "\n";
        return;
    }

    auto options = promptOptions(path, kindName);
    if (!options)
    {
        return;
    }

    auto result = kmslocal::persistence::loadAdapter(*options, m_crypto);
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "open store");
        return;
    }
    m_adapter = std::move(std::get<kmslocal::persistence::AdapterPtr>(result));
    m_out << "Store opened.\n";
}

void InteractiveShell::doClose()
{
    if (!requireOpen())
    {
        return;
    }
    m_adapter.reset();
    m_out << "Store closed.\n";
}

void InteractiveShell::doCount()
{
    if (!requireOpen())
    {
        return;
    }
    const auto result = m_adapter->count();
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "read count");
        return;
    }
    m_out << std::get<kmslocal::core::Version>(result) << "\n";
}

void InteractiveShell::doList()
{
    if (!requireOpen())
    {
        return;
    }

    auto result = m_adapter->store().storeReader();
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "list keys");
        return;
    }

    const auto& reader = std::get<kmslocal::core::StoreReader<kmslocal::core::KeyRecord>>(result);
    if (reader.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& [version, record] : reader)
    {
        m_out << " - v" << version << " created=" << record.createdAtUnixSeconds << " bytes=" << record.data.size()
              << "\n";
    }
}

void InteractiveShell::doAdd(std::size_t sizeBytes, const std::optional<std::string>& hex)
{
    if (!requireOpen())
    {
        return;
    }

    kmslocal::core::KeyRecord record{};
    if (hex)
    {
        auto bytes{ kmslocal::config::parseHexBytes(*hex) };
        if (!bytes || bytes->empty())
        {
            m_out << "Error: --hex needs a non-empty, even number of hex digits.\n";
            return;
        }
        record = kmslocal::core::KeyRecordBuilder{ std::move(*bytes) }.build();
    }
    else
    {
        auto generated = kmslocal::core::generateKeyRecord(sizeBytes);
        if (const auto* err = std::get_if<KeyStoreError>(&generated))
        {
            reportError(*err, "generate key");
            return;
        }
        record = std::move(std::get<kmslocal::core::KeyRecordBuilder>(generated)).build();
    }

    const auto result = m_adapter->update(std::move(record));
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "add key");
        return;
    }
    m_out << "Added version " << std::get<kmslocal::core::Version>(result) << ".\n";
}

void InteractiveShell::doGet(std::uint64_t version)
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_adapter->getWithVersion(version);
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "read key");
        return;
    }
    const auto& found = std::get<std::optional<kmslocal::core::VersionedKeyRecord>>(result);
    if (!found)
    {
        m_out << "Error: Version " << version << " not found.\n";
        return;
    }
    printRecord(*found);
}

void InteractiveShell::doLatest()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_adapter->latestWithVersion();
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "read key");
        return;
    }
    const auto& found = std::get<std::optional<kmslocal::core::VersionedKeyRecord>>(result);
    if (!found)
    {
        m_out << "(empty)\n";
        return;
    }
    printRecord(*found);
}

void InteractiveShell::doRm(std::uint64_t version)
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_adapter->drop(version);
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "remove key");
        return;
    }
    if (!std::get<std::optional<kmslocal::core::KeyRecord>>(result))
    {
        m_out << "Error: Version " << version << " not found.\n";
        return;
    }
    m_out << "Removed version " << version << ".\n";
}

void InteractiveShell::doSave()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_adapter->save();
    if (const auto* err = std::get_if<KeyStoreError>(&result))
    {
        reportError(*err, "save store");
        return;
    }
    m_out << "Saved.\n";
}

} // namespace kmslocal::ui::cli
