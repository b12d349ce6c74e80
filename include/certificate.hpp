#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{

/** @struct CertificateRecord
 *  @brief The logical content of a completion certificate.
 */
struct CertificateRecord
{
    std::string jobId;
    std::string os;
    std::string target;
    std::string action;
    std::string status;
    /* UTC, %Y-%m-%dT%H:%M:%SZ */
    std::string timestamp;

    bool operator==(const CertificateRecord&) const = default;
};

/** @brief Serialize a record as compact JSON with sorted keys.
 *  @details The same logical record always yields the same bytes, so this
 *    is the form that gets signed and persisted.
 */
std::string canonicalize(const CertificateRecord& record);

/** @brief Parse a canonical payload back into a record.
 *  @throws CorruptRecord if the payload is not a certificate.
 */
CertificateRecord parseCertificate(std::string_view payload);

/** @struct Certificate
 *  @brief A persisted certificate: payload, detached signature and the
 *  sibling files they were read from.
 */
struct Certificate
{
    std::string payload;
    std::vector<uint8_t> signature;
    std::filesystem::path payloadPath;
    std::filesystem::path signaturePath;
};

} // namespace cryptowipe
