#ifndef NMEA_SENTENCE_STREAM_HH_
#define NMEA_SENTENCE_STREAM_HH_

#include <cstddef>
#include <cstdint>
#include <functional>

#include "fix_model.hh"

/**
 * Byte-at-a-time NMEA 0183 sentence parser.
 *
 * Reassembles sentences from a raw serial stream, verifies the XOR checksum, splits the sentence into fields and
 * dispatches RMC, GGA, GSA and GSV sentences (GP, GL and GN talkers) to a decoder that updates the FixModel it was
 * constructed with. Nothing in the byte path allocates, blocks or throws; malformed input only shows up in the
 * FixModel diagnostic counters.
 */
class NMEASentenceStream {
   public:
    static constexpr size_t kMaxSentenceLen = 90;  // Longest supported sentence, counted from after the '$'.
    static constexpr size_t kMaxFields = 24;       // GSV is the widest supported sentence at 20 fields.
    static constexpr size_t kIdentifierLen = 5;
    static constexpr uint8_t kMinValidChar = 10;
    static constexpr uint8_t kMaxValidChar = 126;
    static constexpr char kSentenceStartChar = '$';
    static constexpr char kChecksumDelimiter = '*';
    static constexpr char kFieldDelimiter = ',';

    /**
     * Identifier of a sentence that was checksummed, recognized and decoded.
     */
    struct SentenceId {
        enum Talker : uint8_t { kTalkerNone = 0, kTalkerGPS = 1, kTalkerGLONASS = 2, kTalkerCombined = 3 };
        enum Type : uint8_t { kTypeNone = 0, kTypeRMC = 1, kTypeGGA = 2, kTypeGSA = 3, kTypeGSV = 4 };

        static constexpr uint16_t kNumTalkers = 4;
        static constexpr uint16_t kNumTypes = 5;

        Talker talker = kTalkerNone;
        Type type = kTypeNone;

        bool IsValid() const { return talker != kTalkerNone && type != kTypeNone; }
        explicit operator bool() const { return IsValid(); }

        /**
         * Five character identifier such as "GPRMC", or "" for an invalid identifier.
         */
        const char* GetName() const;

        bool operator==(const SentenceId& other) const { return talker == other.talker && type == other.type; }
        bool operator!=(const SentenceId& other) const { return !(*this == other); }

        /**
         * Look up a sentence identifier field. Returns an invalid SentenceId for anything unsupported.
         */
        static SentenceId FromIdentifier(const char* identifier);
    };

    enum State : uint8_t {
        kIdle,        // Waiting for '$'.
        kInSentence,  // Accumulating checksum protected bytes.
        kInChecksum   // Reading the two hex checksum digits.
    };

    struct NMEASentenceStreamConfig {
        // Decode into a staged copy of the FixModel and commit only if the whole sentence decodes. When false, fields
        // written before a failing field stay written.
        bool atomic_sentence_updates = true;
        // Millisecond clock used to stamp fixes. Defaults to the board uptime clock.
        std::function<uint32_t()> get_time_ms = nullptr;
    };

    explicit NMEASentenceStream(FixModel& fix);
    NMEASentenceStream(FixModel& fix, const NMEASentenceStreamConfig& config);

    /**
     * Consume one byte from the receiver.
     * @param[in] byte Raw byte from the serial stream.
     * @retval Identifier of the sentence this byte completed, if it was checksummed, recognized and decoded. Invalid
     * otherwise.
     */
    SentenceId FeedByte(uint8_t byte);

    /**
     * Feed a buffer of raw bytes in order.
     * @retval Number of sentences successfully decoded from the buffer.
     */
    size_t ParseData(const uint8_t* buffer, size_t length);

    /**
     * Drop any partially received sentence. The FixModel is left untouched.
     */
    void Reset();

    State GetState() const { return state_; }
    const FixModel& GetFixModel() const { return fix_; }
    void SetAtomicSentenceUpdates(bool enabled) { config_.atomic_sentence_updates = enabled; }

    size_t GetDiagnostics(char* buffer, size_t max_len) const;

   private:
    // Null terminated views into the sentence buffer, split on ','.
    struct FieldList {
        char* fields[kMaxFields] = {nullptr};
        size_t count = 0;

        const char* Get(size_t index) const { return index < count ? fields[index] : nullptr; }
    };

    void StartSentence();
    SentenceId ResolveChecksum();
    SentenceId ProcessSentence();
    void SplitFields(FieldList& fields);
    bool DecodeSentence(SentenceId::Type type, const FieldList& fields, FixModel& target);

    bool DecodeRMC(const FieldList& fields, FixModel& target);  // Recommended minimum
    bool DecodeGGA(const FieldList& fields, FixModel& target);  // Position fix
    bool DecodeGSA(const FieldList& fields, FixModel& target);  // DOP and active satellites
    bool DecodeGSV(const FieldList& fields, FixModel& target);  // Satellites in view

    void MarkFixTime(FixModel& target) const;
    uint32_t GetTimeMs() const;

    FixModel& fix_;
    NMEASentenceStreamConfig config_;

    State state_ = kIdle;
    char sentence_buffer_[kMaxSentenceLen + 1];
    size_t buffer_pos_ = 0;
    size_t char_count_ = 0;
    uint8_t crc_xor_ = 0;
    char checksum_digits_[2] = {0, 0};
    size_t checksum_pos_ = 0;
};

#endif  // NMEA_SENTENCE_STREAM_HH_
