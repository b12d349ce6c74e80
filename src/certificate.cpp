#include "certificate.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cryptowipe
{

using json = nlohmann::json;

std::string canonicalize(const CertificateRecord& record)
{
    // nlohmann::json objects keep their keys sorted
    json j = {{"job_id", record.jobId},
              {"os", record.os},
              {"target", record.target},
              {"action", record.action},
              {"status", record.status},
              {"timestamp", record.timestamp}};
    return j.dump();
}

CertificateRecord parseCertificate(std::string_view payload)
{
    try
    {
        json j = json::parse(payload);
        CertificateRecord record;
        record.jobId = j.at("job_id").get<std::string>();
        record.os = j.at("os").get<std::string>();
        record.target = j.at("target").get<std::string>();
        record.action = j.at("action").get<std::string>();
        record.status = j.at("status").get<std::string>();
        record.timestamp = j.at("timestamp").get<std::string>();
        return record;
    }
    catch (const json::exception& e)
    {
        throw CorruptRecord(std::string("certificate payload: ") + e.what());
    }
}

} // namespace cryptowipe
