#include "verification.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

bool is_valid_segment(std::string_view s) {
    if (s.empty() || s == "." || s == "..") return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

std::string_view strip_prefix(std::string_view s) {
    for (std::string_view prefix : {"https://github.com/", "http://github.com/", "github.com/"}) {
        if (s.starts_with(prefix)) {
            return s.substr(prefix.size());
        }
    }
    return s;
}

}

PackageReference PackageReference::parse(const std::string& text) {
    const std::string trimmed = trim(text);
    std::string_view s = strip_prefix(trimmed);
    PackageReference ref;

    const size_t slash = s.find('/');
    if (slash == std::string_view::npos) {
        if (!is_valid_segment(s)) {
            throw InvalidReferenceError(string_format("error.invalid_reference", trimmed));
        }
        ref.kind = Kind::Name;
        ref.name = std::string(s);
        return ref;
    }

    std::string_view owner = s.substr(0, slash);
    std::string_view rest = s.substr(slash + 1);
    std::string_view repository = rest.substr(0, rest.find('/')); // deeper path segments are ignored
    if (repository.ends_with(".git")) {
        repository.remove_suffix(4);
    }
    if (!is_valid_segment(owner) || !is_valid_segment(repository)) {
        throw InvalidReferenceError(string_format("error.invalid_reference", trimmed));
    }

    ref.kind = Kind::Raw;
    ref.repo = RepositoryRef{std::string(owner), std::string(repository)};
    return ref;
}

TrustRegistry parse_trust_registry(const std::string& text) {
    TrustRegistry registry;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t sep = line.find(" : ");
        if (sep == std::string::npos) {
            log_warning(string_format("warning.registry_malformed_line", line));
            continue;
        }
        const std::string name = trim(line.substr(0, sep));
        try {
            PackageReference target = PackageReference::parse(line.substr(sep + 3));
            if (target.kind != PackageReference::Kind::Raw || !is_valid_segment(name)) {
                log_warning(string_format("warning.registry_malformed_line", line));
                continue;
            }
            registry[name] = std::move(target.repo);
        } catch (const InvalidReferenceError&) {
            log_warning(string_format("warning.registry_malformed_line", line));
        }
    }
    return registry;
}

TrustRegistry load_trust_registry(ContentSource& source, const Settings& settings) {
    const RepositoryRef self{settings.self_owner, settings.self_repo};
    try {
        ContentResponse response = source.fetch(self, settings.registry_path);
        if (!response.ok()) {
            log_warning(string_format("warning.registry_fetch_failed", response.status));
            return {};
        }
        TrustRegistry registry = parse_trust_registry(response.content);
        log_info(string_format("info.registry_loaded", registry.size()));
        return registry;
    } catch (const HotpackException& e) {
        log_warning(string_format("warning.registry_build_failed", std::string(e.what())));
        return {};
    }
}

VerificationService::VerificationService(TrustRegistry registry) : registry_(std::move(registry)) {}

void VerificationService::confirm() {
    confirmed_.store(true);
}

bool VerificationService::confirmation_pending() const {
    return confirmed_.load();
}

std::optional<RepositoryRef> VerificationService::lookup(const std::string& name) const {
    auto it = registry_.find(name);
    if (it == registry_.end()) return std::nullopt;
    return it->second;
}

GateResult VerificationService::evaluate(const PackageReference& ref, bool safe_mode) {
    return decide(ref, safe_mode, confirmed_.exchange(false));
}

GateResult VerificationService::evaluate(const std::string& reference, bool safe_mode) {
    const bool confirmed = confirmed_.exchange(false);
    return decide(PackageReference::parse(reference), safe_mode, confirmed);
}

GateResult VerificationService::decide(const PackageReference& ref, bool safe_mode, bool confirmed) const {
    GateResult result;
    result.confirmation_consumed = confirmed;

    if (ref.kind == PackageReference::Kind::Name) {
        // Registry lookup only ever applies to bare names
        auto repo = lookup(ref.name);
        if (!repo) {
            throw InvalidReferenceError(string_format("error.unknown_package_name", ref.name));
        }
        result.repo = *repo;
        result.registry_match = true;
        result.decision = GateDecision::Proceed;
        return result;
    }

    result.repo = ref.repo;
    if (!safe_mode || result.confirmation_consumed) {
        result.decision = GateDecision::Proceed;
    } else {
        result.decision = GateDecision::Blocked;
    }
    return result;
}
