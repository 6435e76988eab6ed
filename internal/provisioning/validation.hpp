#pragma once

#include <optional>
#include <regex>
#include <string>

#include "hosting/v1/provisioning.pb.h"

namespace hosting::provisioning {

// Identifiers end up in file names and cache keys. Throws
// util::ValidationError.
void ValidateSessionId(const std::string& session_id);
void ValidateCertificateId(const std::string& certificate_id);

/*
  Checks one record on its own and normalizes it in place (path prefixes
  gain their leading and trailing '/').

  References to certificates and prefixes claimed by other sessions are
  checked when the complete configuration is generated.
*/
void NormalizeRecord(const std::string& session_id, hosting::v1::ContentHostingConfiguration* record);

// Empty pattern means "everything". Throws util::ValidationError.
std::optional<std::regex> CompilePurgePattern(const std::string& pattern);

} // namespace hosting::provisioning
