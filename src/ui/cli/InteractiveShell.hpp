#ifndef KMSLOCAL_UI_CLI_INTERACTIVESHELL_HPP
#define KMSLOCAL_UI_CLI_INTERACTIVESHELL_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/crypto/ICryptoProvider.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include "kmslocal/security/SecureString.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace kmslocal::ui::cli
{

// In tests: returns a pre-determined string.
using KeyReader = std::function<kmslocal::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    // `defaultKind` is used by create/open unless the command names --adapter.
    InteractiveShell(kmslocal::crypto::ICryptoProvider& crypto, kmslocal::persistence::AdapterKind defaultKind,
                     std::istream& in, std::ostream& out, KeyReader keyReader);

    // Loads the store at options.path, or binds a new empty one if nothing is there yet.
    bool openWith(const kmslocal::persistence::AdapterOptions& options);

    int run();

private:
    kmslocal::crypto::ICryptoProvider& m_crypto;
    kmslocal::persistence::AdapterKind m_defaultKind;
    std::istream& m_in;
    std::ostream& m_out;
    KeyReader m_keyReader;

    std::unique_ptr<kmslocal::persistence::IPersistenceAdapter> m_adapter;
    bool m_running{ true };

    void processLine(const std::string& line);
    [[nodiscard]] bool requireOpen();
    [[nodiscard]] std::optional<kmslocal::persistence::AdapterOptions> promptOptions(const std::string& path,
                                                                                  const std::string& kindName);
    void reportError(kmslocal::core::KeyStoreError e, const char* action);
    void printRecord(const kmslocal::core::VersionedKeyRecord& v);

    void doCreate(const std::string& path, const std::string& kindName);
    void doOpen(const std::string& path, const std::string& kindName);
    void doClose();
    void doCount();
    void doList();
    // `hex` is set when --hex was given, even with an empty value.
    void doAdd(std::size_t sizeBytes, const std::optional<std::string>& hex);
    void doGet(std::uint64_t version);
    void doLatest();
    void doRm(std::uint64_t version);
    void doSave();
};

} // namespace kmslocal::ui::cli

#endif // KMSLOCAL_UI_CLI_INTERACTIVESHELL_HPP
