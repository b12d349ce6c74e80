#include "container.hpp"

#include "cipher.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <openssl/crypto.h>

#include <phosphor-logging/lg2.hpp>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>

namespace cryptowipe
{

namespace codec
{

namespace
{

constexpr size_t nameLenSize = 2;
constexpr size_t dataLenSize = 8;

uint64_t readBigEndian(std::span<const uint8_t> bytes)
{
    uint64_t value = 0;
    for (uint8_t b : bytes)
    {
        value = (value << 8) | b;
    }
    return value;
}

void writeBigEndian(std::vector<uint8_t>& out, uint64_t value, size_t width)
{
    for (size_t i = width; i > 0; i--)
    {
        out.push_back(static_cast<uint8_t>(value >> ((i - 1) * 8)));
    }
}

bool isPlainName(const std::string& name)
{
    return !name.empty() && name != "." && name != ".." &&
           std::filesystem::path(name).filename().string() == name;
}

} // namespace

std::vector<uint8_t> serializeEnvelope(const Envelope& envelope)
{
    std::vector<uint8_t> out;
    out.reserve(magic.size() + 1 + envelope.nonce.size() +
                envelope.sealed.size());
    out.insert(out.end(), magic.begin(), magic.end());
    out.push_back(static_cast<uint8_t>(envelope.nonce.size()));
    out.insert(out.end(), envelope.nonce.begin(), envelope.nonce.end());
    out.insert(out.end(), envelope.sealed.begin(), envelope.sealed.end());
    return out;
}

Envelope parseEnvelope(std::span<const uint8_t> bytes, std::string_view name)
{
    if (bytes.size() < magic.size() + 1 ||
        !std::equal(magic.begin(), magic.end(), bytes.begin()))
    {
        throw InvalidContainer(name, "bad magic");
    }
    size_t nonceLen = bytes[magic.size()];
    std::span<const uint8_t> rest = bytes.subspan(magic.size() + 1);
    if (nonceLen == 0 || rest.size() < nonceLen + aead::tagSize)
    {
        throw InvalidContainer(name, "truncated header");
    }

    Envelope envelope;
    envelope.nonce.assign(rest.begin(), rest.begin() + nonceLen);
    envelope.sealed.assign(rest.begin() + nonceLen, rest.end());
    return envelope;
}

void appendRecord(std::vector<uint8_t>& plaintext, std::string_view name,
                  std::span<const uint8_t> content)
{
    writeBigEndian(plaintext, name.size(), nameLenSize);
    plaintext.insert(plaintext.end(), name.begin(), name.end());
    writeBigEndian(plaintext, content.size(), dataLenSize);
    plaintext.insert(plaintext.end(), content.begin(), content.end());
}

std::vector<FileRecord> parseRecords(std::span<const uint8_t> plaintext)
{
    std::vector<FileRecord> records;
    size_t idx = 0;
    while (idx < plaintext.size())
    {
        size_t remaining = plaintext.size() - idx;
        if (remaining < nameLenSize)
        {
            throw CorruptRecord("truncated name length at offset " +
                                std::to_string(idx));
        }
        uint64_t nameLen = readBigEndian(plaintext.subspan(idx, nameLenSize));
        idx += nameLenSize;
        remaining -= nameLenSize;
        if (nameLen > remaining)
        {
            throw CorruptRecord("name length " + std::to_string(nameLen) +
                                " exceeds remaining " +
                                std::to_string(remaining));
        }
        FileRecord record;
        record.name.assign(plaintext.begin() + idx,
                           plaintext.begin() + idx + nameLen);
        idx += nameLen;
        remaining -= nameLen;

        if (remaining < dataLenSize)
        {
            throw CorruptRecord("truncated data length for '" + record.name +
                                "'");
        }
        uint64_t dataLen = readBigEndian(plaintext.subspan(idx, dataLenSize));
        idx += dataLenSize;
        remaining -= dataLenSize;
        if (dataLen > remaining)
        {
            throw CorruptRecord("data length " + std::to_string(dataLen) +
                                " of '" + record.name + "' exceeds remaining " +
                                std::to_string(remaining));
        }
        record.content.assign(plaintext.begin() + idx,
                              plaintext.begin() + idx + dataLen);
        idx += dataLen;
        records.push_back(std::move(record));
    }
    return records;
}

std::string recordName(std::string_view requested)
{
    std::string name =
        std::filesystem::path(std::string(requested)).filename().string();
    if (!isPlainName(name) ||
        name.size() > std::numeric_limits<uint16_t>::max())
    {
        throw InvalidRecordName(requested);
    }
    return name;
}

} // namespace codec

KeyMaterial Container::loadKey(const std::filesystem::path& keyPath)
{
    KeyMaterial key = KeyStore::load(keyPath);
    if (key.size() != KeyMaterial::keySize)
    {
        throw InvalidKeyMaterial(keyPath.string(), key.size());
    }
    return key;
}

std::vector<uint8_t> Container::encrypt(const KeyMaterial& key,
                                        std::span<const uint8_t> plaintext)
{
    Envelope envelope;
    envelope.nonce = util::randomBytes(aead::nonceSize);
    envelope.sealed = aead::seal(key.bytes(), envelope.nonce, plaintext);
    return codec::serializeEnvelope(envelope);
}

Envelope Container::readEnvelope() const
{
    std::vector<uint8_t> bytes = util::readFile(containerPath);
    return codec::parseEnvelope(bytes, containerPath.string());
}

std::vector<uint8_t> Container::decrypt(const KeyMaterial& key) const
{
    Envelope envelope = readEnvelope();
    return aead::open(key.bytes(), envelope.nonce, envelope.sealed,
                      containerPath.string());
}

void Container::create(const std::filesystem::path& keyPath)
{
    std::error_code ec;
    if (std::filesystem::exists(containerPath, ec))
    {
        throw AlreadyExists(containerPath.string());
    }

    if (!std::filesystem::exists(keyPath, ec))
    {
        KeyStore::save(KeyStore::generate(), keyPath);
    }
    KeyMaterial key = loadKey(keyPath);

    util::publishExclusive(containerPath, encrypt(key, {}));
    lg2::info("Created container {FILE}", "FILE", containerPath.string(),
              "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.ContainerCreated"));
}

void Container::addFile(const std::filesystem::path& keyPath,
                        std::string_view name,
                        std::span<const uint8_t> content)
{
    KeyMaterial key = loadKey(keyPath);
    std::string stored = codec::recordName(name);

    std::vector<uint8_t> plaintext = decrypt(key);
    codec::appendRecord(plaintext, stored, content);
    std::vector<uint8_t> sealed = encrypt(key, plaintext);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());

    util::atomicReplace(containerPath, sealed);
    lg2::info("Added {SIZE} byte record to {FILE}", "SIZE", content.size(),
              "FILE", containerPath.string(), "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.ContainerRecordAdded"));
}

std::vector<FileRecord>
    Container::records(const std::filesystem::path& keyPath) const
{
    KeyMaterial key = loadKey(keyPath);
    std::vector<uint8_t> plaintext = decrypt(key);
    std::vector<FileRecord> result = codec::parseRecords(plaintext);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return result;
}

std::vector<std::string>
    Container::list(const std::filesystem::path& keyPath) const
{
    std::vector<std::string> names;
    for (FileRecord& record : records(keyPath))
    {
        names.push_back(std::move(record.name));
    }
    return names;
}

void Container::extractAll(const std::filesystem::path& keyPath,
                           const std::filesystem::path& outDir) const
{
    std::vector<FileRecord> all = records(keyPath);
    for (const FileRecord& record : all)
    {
        if (!codec::isPlainName(record.name))
        {
            throw CorruptRecord("unsafe record name '" + record.name + "'");
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec)
    {
        throw IOError(outDir.string(), ec.message());
    }

    for (const FileRecord& record : all)
    {
        util::atomicReplace(outDir / record.name, record.content);
    }
    lg2::info("Extracted {COUNT} records from {FILE} to {DIR}", "COUNT",
              all.size(), "FILE", containerPath.string(), "DIR",
              outDir.string(), "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.ContainerExtracted"));
}

} // namespace cryptowipe
