#pragma once

#include "config.hpp"
#include "content_source.hpp"

#include <atomic>
#include <map>
#include <optional>
#include <string>

struct PackageReference {
    enum class Kind { Name, Raw };

    Kind kind = Kind::Name;
    std::string name;   // set for Kind::Name
    RepositoryRef repo; // set for Kind::Raw

    // Accepts "https://github.com/<owner>/<repo>", "<owner>/<repo>" or a bare
    // registry name. Throws InvalidReferenceError on anything else.
    static PackageReference parse(const std::string& text);
};

using TrustRegistry = std::map<std::string, RepositoryRef>;

// Parses the authoritative list: "name : owner/repo" per line, '#' comments.
TrustRegistry parse_trust_registry(const std::string& text);

// Best effort: any failure logs a warning and yields an empty registry.
TrustRegistry load_trust_registry(ContentSource& source, const Settings& settings);

enum class GateDecision {
    Proceed,
    Blocked
};

struct GateResult {
    GateDecision decision = GateDecision::Blocked;
    RepositoryRef repo;
    bool registry_match = false;
    bool confirmation_consumed = false;
};

// Owns the process-wide trust state: the registry (immutable once built) and
// the one-shot confirmation flag.
class VerificationService {
public:
    VerificationService() = default;
    explicit VerificationService(TrustRegistry registry);

    VerificationService(const VerificationService&) = delete;
    VerificationService& operator=(const VerificationService&) = delete;

    // Grants one pending confirmation. Repeated calls do not stack.
    void confirm();
    bool confirmation_pending() const;

    std::optional<RepositoryRef> lookup(const std::string& name) const;

    // Decides one install attempt. A pending confirmation is consumed by this
    // call whatever the outcome; two concurrent callers can never both see it.
    // Throws InvalidReferenceError for a bare name the registry does not know.
    GateResult evaluate(const PackageReference& ref, bool safe_mode);

    // Same, starting from the text the owner typed. The confirmation is
    // consumed before parsing, so a malformed reference also uses it up.
    GateResult evaluate(const std::string& reference, bool safe_mode);

private:
    GateResult decide(const PackageReference& ref, bool safe_mode, bool confirmed) const;

    const TrustRegistry registry_;
    std::atomic<bool> confirmed_{false};
};
