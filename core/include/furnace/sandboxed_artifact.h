#pragma once

#include "furnace/contract.h"
#include "furnace/log.h"
#include "furnace/package.h"
#include "furnace/sandbox.h"

#include <string>

namespace furnace {

// ISaifContract + IArtifactProbe over the Sandbox Runner: every call gets a
// fresh SandboxInstance, runs the call shim inside it and tears it down.
class SandboxedArtifact : public ISaifContract, public IArtifactProbe {
public:
    SandboxedArtifact(const ArtifactPackage& pkg, SandboxRunner& runner, JsonlLogger* log = nullptr);

    CallResult ingest(Workspace& ws, const std::vector<std::string>& events, const IngestOptions& opt) override;
    CallResult compact(Workspace& ws, int64_t target_bytes) override;
    CallResult audit(const Workspace& ws) override;

    CallResult selftest() override;
    CallResult syntax_check() override;
    CallResult import_check() override;

    // Interpreter version ("3.11.4") reported from inside a sandbox.
    CallResult runtime_version(std::string* version);

private:
    std::string bindings_json() const;

    // Run one shim operation. *result_json receives the shim's result document
    // when status is OK.
    CallResult invoke(const std::string& op,
                      const std::string& label,
                      const std::filesystem::path& workspace,
                      const std::string& request_json,
                      std::string* result_json);

    const ArtifactPackage& pkg_;
    SandboxRunner& runner_;
    JsonlLogger* log_;
    uint64_t calls_{0};
};

// true when `actual` ("3.11.4") satisfies `pin` ("3.11" or "3.11.4").
bool runtime_matches_pin(const std::string& actual, const std::string& pin);

} // namespace furnace
