#include "nmea_sentence_stream.hh"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef ON_EMBEDDED_DEVICE
#include "pico/stdlib.h"
#define GET_TIME_MS() to_ms_since_boot(get_absolute_time())
#else
#include <chrono>
#define GET_TIME_MS()                                                                              \
    static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(                   \
                              std::chrono::steady_clock::now().time_since_epoch())                 \
                              .count())
#endif

namespace {

const char* const kTalkerCodes[NMEASentenceStream::SentenceId::kNumTalkers] = {"", "GP", "GL", "GN"};
const char* const kTypeCodes[NMEASentenceStream::SentenceId::kNumTypes] = {"", "RMC", "GGA", "GSA", "GSV"};

const char* const kSentenceNames[NMEASentenceStream::SentenceId::kNumTalkers]
                                [NMEASentenceStream::SentenceId::kNumTypes] = {
                                    {"", "", "", "", ""},
                                    {"", "GPRMC", "GPGGA", "GPGSA", "GPGSV"},
                                    {"", "GLRMC", "GLGGA", "GLGSA", "GLGSV"},
                                    {"", "GNRMC", "GNGGA", "GNGSA", "GNGSV"},
};

constexpr uint8_t kMaxSVBlocksPerGSV = 4;
constexpr size_t kGSVFirstBlockField = 4;
constexpr size_t kGSVFieldsPerBlock = 4;
constexpr size_t kGSAFirstSatelliteField = 3;
constexpr int kMaxLatitudeDeg = 90;
constexpr int kMaxLongitudeDeg = 180;

int HexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Parse exactly num_digits decimal digits.
bool ParseDigits(const char* field, size_t num_digits, int& value) {
    value = 0;
    for (size_t i = 0; i < num_digits; i++) {
        if (field[i] < '0' || field[i] > '9') return false;
        value = value * 10 + (field[i] - '0');
    }
    return true;
}

// Plain decimal number: digits with at most one '.', and an optional leading '-' where negative values are allowed.
// Rejects what strtol/strtod would otherwise accept (whitespace, '+', hex, "nan", "inf", exponents).
bool IsDecimalNumber(const char* field, bool allow_fraction, bool allow_negative) {
    if (!field) return false;
    if (allow_negative && field[0] == '-') field++;
    bool has_digit = false;
    bool has_point = false;
    for (; *field != '\0'; field++) {
        if (*field >= '0' && *field <= '9') {
            has_digit = true;
        } else if (*field == '.' && allow_fraction && !has_point) {
            has_point = true;
        } else {
            return false;
        }
    }
    return has_digit;
}

// Unsigned integer that must fill the whole field.
bool ParseUnsigned(const char* field, long max_value, long& value) {
    if (!IsDecimalNumber(field, false, false)) return false;
    char* endptr;
    value = strtol(field, &endptr, 10);
    return *endptr == '\0' && value >= 0 && value <= max_value;
}

// Real number that must fill the whole field.
bool ParseReal(const char* field, double& value, bool allow_negative = false) {
    if (!IsDecimalNumber(field, true, allow_negative)) return false;
    char* endptr;
    value = strtod(field, &endptr);
    return *endptr == '\0' && std::isfinite(value);
}

// Empty or missing fields read as the default; anything else must be numeric.
bool ParseOptionalReal(const char* field, double default_val, double& value) {
    if (!field || field[0] == '\0') {
        value = default_val;
        return true;
    }
    return ParseReal(field, value);
}

int16_t ParseSatelliteField(const char* field) {
    long value;
    if (ParseUnsigned(field, INT16_MAX, value)) {
        return static_cast<int16_t>(value);
    }
    return FixModel::kSatelliteFieldMissing;
}

// HHMMSS[.sss]
bool ParseTime(const char* field, FixModel::Timestamp& timestamp) {
    if (strlen(field) < 6) return false;
    int hour, minute;
    double second;
    if (!ParseDigits(field, 2, hour) || !ParseDigits(field + 2, 2, minute) || !ParseReal(field + 4, second)) {
        return false;
    }
    if (hour > 23 || minute > 59 || second < 0.0 || second >= 60.0) {
        return false;
    }
    timestamp.hour = static_cast<uint8_t>(hour);
    timestamp.minute = static_cast<uint8_t>(minute);
    timestamp.second = static_cast<float>(second);
    return true;
}

// DDMMYY
bool ParseDate(const char* field, FixModel::Date& date) {
    if (strlen(field) != 6) return false;
    int day, month, year;
    if (!ParseDigits(field, 2, day) || !ParseDigits(field + 2, 2, month) || !ParseDigits(field + 4, 2, year)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > FixModel::DaysInMonth(month, FixModel::kCenturyBase + year)) {
        return false;
    }
    date.day = static_cast<uint8_t>(day);
    date.month = static_cast<uint8_t>(month);
    date.year = static_cast<uint8_t>(year);
    return true;
}

// DDMM.mmmm (latitude, 2 degree digits) or DDDMM.mmmm (longitude, 3 degree digits) plus a hemisphere field that must
// be one of the two letters allowed for the axis.
bool ParseCoordinate(const char* value_field, const char* hemisphere_field, size_t degree_digits, int max_degrees,
                     char positive, char negative, FixModel::Coordinate& coordinate) {
    if (!value_field || !hemisphere_field) return false;
    if (strlen(value_field) <= degree_digits) return false;
    int degrees;
    double minutes;
    if (!ParseDigits(value_field, degree_digits, degrees) || !ParseReal(value_field + degree_digits, minutes)) {
        return false;
    }
    if (minutes < 0.0 || minutes >= 60.0) return false;
    if (degrees > max_degrees || (degrees == max_degrees && minutes > 0.0)) return false;
    if (strlen(hemisphere_field) != 1) return false;
    char hemisphere = hemisphere_field[0];
    if (hemisphere != positive && hemisphere != negative) return false;

    coordinate.degrees = static_cast<uint16_t>(degrees);
    coordinate.minutes = minutes;
    coordinate.hemisphere = hemisphere;
    return true;
}

}  // namespace

const char* NMEASentenceStream::SentenceId::GetName() const {
    if (talker >= kNumTalkers || type >= kNumTypes) return "";
    return kSentenceNames[talker][type];
}

NMEASentenceStream::SentenceId NMEASentenceStream::SentenceId::FromIdentifier(const char* identifier) {
    SentenceId id;
    if (!identifier || strlen(identifier) != kIdentifierLen) return id;

    for (uint16_t t = kTalkerGPS; t < kNumTalkers; t++) {
        if (strncmp(identifier, kTalkerCodes[t], 2) == 0) {
            id.talker = static_cast<Talker>(t);
            break;
        }
    }
    for (uint16_t t = kTypeRMC; t < kNumTypes; t++) {
        if (strcmp(identifier + 2, kTypeCodes[t]) == 0) {
            id.type = static_cast<Type>(t);
            break;
        }
    }
    if (!id.IsValid()) {
        return SentenceId();
    }
    return id;
}

NMEASentenceStream::NMEASentenceStream(FixModel& fix) : NMEASentenceStream(fix, NMEASentenceStreamConfig()) {}

NMEASentenceStream::NMEASentenceStream(FixModel& fix, const NMEASentenceStreamConfig& config)
    : fix_(fix), config_(config) {
    Reset();
}

void NMEASentenceStream::Reset() {
    state_ = kIdle;
    buffer_pos_ = 0;
    char_count_ = 0;
    crc_xor_ = 0;
    checksum_pos_ = 0;
    memset(sentence_buffer_, 0, sizeof(sentence_buffer_));
}

void NMEASentenceStream::StartSentence() {
    state_ = kInSentence;
    buffer_pos_ = 0;
    char_count_ = 0;
    crc_xor_ = 0;
    checksum_pos_ = 0;
}

size_t NMEASentenceStream::ParseData(const uint8_t* buffer, size_t length) {
    if (!buffer || length == 0) return 0;

    size_t sentences_decoded = 0;
    for (size_t i = 0; i < length; i++) {
        if (FeedByte(buffer[i])) {
            sentences_decoded++;
        }
    }
    return sentences_decoded;
}

NMEASentenceStream::SentenceId NMEASentenceStream::FeedByte(uint8_t byte) {
    if (byte == kSentenceStartChar) {
        StartSentence();
        return SentenceId();
    }
    if (state_ == kIdle) {
        return SentenceId();
    }

    // Line noise is dropped but still counts toward the sentence length.
    char_count_++;
    bool printable = byte >= kMinValidChar && byte <= kMaxValidChar;

    if (printable) {
        switch (state_) {
            case kInSentence:
                if (char_count_ > kMaxSentenceLen) {
                    break;
                }
                if (byte == kChecksumDelimiter) {
                    state_ = kInChecksum;
                    checksum_pos_ = 0;
                } else {
                    sentence_buffer_[buffer_pos_++] = static_cast<char>(byte);
                    crc_xor_ ^= byte;
                }
                break;

            case kInChecksum:
                checksum_digits_[checksum_pos_++] = static_cast<char>(byte);
                if (checksum_pos_ == sizeof(checksum_digits_)) {
                    // The second digit resolves the sentence even at the length limit.
                    return ResolveChecksum();
                }
                break;

            default:
                break;
        }
    }

    if (char_count_ > kMaxSentenceLen) {
        state_ = kIdle;  // Abandoned, wait for the next '$'.
    }
    return SentenceId();
}

NMEASentenceStream::SentenceId NMEASentenceStream::ResolveChecksum() {
    state_ = kIdle;

    int high = HexDigitValue(checksum_digits_[0]);
    int low = HexDigitValue(checksum_digits_[1]);
    if (high < 0 || low < 0) {
        return SentenceId();  // Not a checksum, treat as framing noise.
    }

    uint8_t provided = static_cast<uint8_t>((high << 4) | low);
    if (provided != crc_xor_) {
        fix_.crc_fails++;
        return SentenceId();
    }

    fix_.clean_sentences++;
    return ProcessSentence();
}

void NMEASentenceStream::SplitFields(FieldList& fields) {
    sentence_buffer_[buffer_pos_] = '\0';

    fields.count = 0;
    fields.fields[fields.count++] = sentence_buffer_;
    for (size_t i = 0; i < buffer_pos_ && fields.count < kMaxFields; i++) {
        if (sentence_buffer_[i] == kFieldDelimiter) {
            sentence_buffer_[i] = '\0';
            fields.fields[fields.count++] = &sentence_buffer_[i + 1];
        }
    }
}

NMEASentenceStream::SentenceId NMEASentenceStream::ProcessSentence() {
    FieldList fields;
    SplitFields(fields);

    SentenceId id = SentenceId::FromIdentifier(fields.Get(0));
    if (!id.IsValid()) {
        return SentenceId();
    }

    bool decoded;
    if (config_.atomic_sentence_updates) {
        FixModel staged = fix_;
        decoded = DecodeSentence(id.type, fields, staged);
        if (decoded) {
            fix_ = staged;
        }
    } else {
        decoded = DecodeSentence(id.type, fields, fix_);
    }

    if (!decoded) {
        return SentenceId();
    }
    fix_.parsed_sentences++;
    return id;
}

bool NMEASentenceStream::DecodeSentence(SentenceId::Type type, const FieldList& fields, FixModel& target) {
    switch (type) {
        case SentenceId::kTypeRMC:
            return DecodeRMC(fields, target);
        case SentenceId::kTypeGGA:
            return DecodeGGA(fields, target);
        case SentenceId::kTypeGSA:
            return DecodeGSA(fields, target);
        case SentenceId::kTypeGSV:
            return DecodeGSV(fields, target);
        default:
            return false;
    }
}

bool NMEASentenceStream::DecodeRMC(const FieldList& fields, FixModel& target) {
    // $xxRMC,time,status,lat,NS,lon,EW,speed,course,date,magvar,EW,mode*cs

    // UTC time
    const char* time_field = fields.Get(1);
    if (!time_field) return false;
    if (time_field[0] != '\0') {
        FixModel::Timestamp timestamp;
        if (!ParseTime(time_field, timestamp)) return false;
        target.timestamp = timestamp;
    } else {
        target.timestamp = FixModel::Timestamp();
    }

    // Date (DDMMYY)
    const char* date_field = fields.Get(9);
    if (!date_field) return false;
    if (date_field[0] != '\0') {
        FixModel::Date date;
        if (!ParseDate(date_field, date)) return false;
        target.date = date;
    } else {
        target.date = FixModel::Date();
    }

    // Status (A=active, V=void)
    const char* status = fields.Get(2);
    if (status && strcmp(status, "A") == 0) {
        FixModel::Coordinate latitude, longitude;
        if (!ParseCoordinate(fields.Get(3), fields.Get(4), 2, kMaxLatitudeDeg, 'N', 'S', latitude)) return false;
        if (!ParseCoordinate(fields.Get(5), fields.Get(6), 3, kMaxLongitudeDeg, 'E', 'W', longitude)) return false;

        double speed_knots, course_deg;
        if (!ParseOptionalReal(fields.Get(7), 0.0, speed_knots)) return false;
        if (!ParseOptionalReal(fields.Get(8), 0.0, course_deg)) return false;

        target.latitude = latitude;
        target.longitude = longitude;
        target.speed_knots = speed_knots;
        target.course_deg = course_deg;
        target.valid = true;
        target.has_ever_had_fix = true;
        MarkFixTime(target);
    } else {
        target.latitude = {0, 0.0, 'N'};
        target.longitude = {0, 0.0, 'W'};
        target.speed_knots = 0.0;
        target.course_deg = 0.0;
        target.valid = false;
    }

    return true;
}

bool NMEASentenceStream::DecodeGGA(const FieldList& fields, FixModel& target) {
    // $xxGGA,time,lat,NS,lon,EW,quality,numSV,HDOP,alt,M,sep,M,diffAge,diffStation*cs

    FixModel::Timestamp timestamp;
    const char* time_field = fields.Get(1);
    if (!time_field) return false;
    if (time_field[0] != '\0' && !ParseTime(time_field, timestamp)) return false;

    long fix_stat, satellites_in_use;
    if (!ParseUnsigned(fields.Get(6), UINT8_MAX, fix_stat)) return false;
    if (!ParseUnsigned(fields.Get(7), UINT8_MAX, satellites_in_use)) return false;

    double hdop;
    if (!ParseOptionalReal(fields.Get(8), 0.0, hdop)) {
        hdop = 0.0;
    }

    if (fix_stat) {
        FixModel::Coordinate latitude, longitude;
        if (!ParseCoordinate(fields.Get(2), fields.Get(3), 2, kMaxLatitudeDeg, 'N', 'S', latitude)) return false;
        if (!ParseCoordinate(fields.Get(4), fields.Get(5), 3, kMaxLongitudeDeg, 'E', 'W', longitude)) return false;

        // Altitude and geoid separation are informational; a bad value zeroes both.
        double altitude_m, geoid_height_m;
        if (!ParseReal(fields.Get(9), altitude_m, true) || !ParseReal(fields.Get(11), geoid_height_m, true)) {
            altitude_m = 0.0;
            geoid_height_m = 0.0;
        }

        target.latitude = latitude;
        target.longitude = longitude;
        target.altitude_m = static_cast<float>(altitude_m);
        target.geoid_height_m = static_cast<float>(geoid_height_m);
    }

    target.timestamp = timestamp;
    target.satellites_in_use = static_cast<uint8_t>(satellites_in_use);
    target.hdop = static_cast<float>(hdop);
    target.fix_stat = static_cast<uint8_t>(fix_stat);

    if (fix_stat) {
        MarkFixTime(target);
    }
    return true;
}

bool NMEASentenceStream::DecodeGSA(const FieldList& fields, FixModel& target) {
    // $xxGSA,mode,fixType,prn1,prn2,...,prn12,PDOP,HDOP,VDOP*cs

    long fix_type;
    if (!ParseUnsigned(fields.Get(2), FixModel::k3DFix, fix_type) || fix_type < FixModel::kNoFix) {
        return false;
    }

    uint8_t satellites_used[FixModel::kMaxSatellitesUsed] = {0};
    uint8_t num_satellites_used = 0;
    for (size_t i = 0; i < FixModel::kMaxSatellitesUsed; i++) {
        const char* prn_field = fields.Get(kGSAFirstSatelliteField + i);
        if (!prn_field || prn_field[0] == '\0') {
            break;
        }
        long prn;
        if (!ParseUnsigned(prn_field, UINT8_MAX, prn)) return false;
        satellites_used[num_satellites_used++] = static_cast<uint8_t>(prn);
    }

    // Receivers leave the DOP fields empty while there is no fix.
    double pdop, hdop, vdop;
    if (!ParseOptionalReal(fields.Get(15), 0.0, pdop) || !ParseOptionalReal(fields.Get(16), 0.0, hdop) ||
        !ParseOptionalReal(fields.Get(17), 0.0, vdop)) {
        return false;
    }

    target.fix_type = static_cast<FixModel::FixType>(fix_type);
    memcpy(target.satellites_used, satellites_used, sizeof(target.satellites_used));
    target.num_satellites_used = num_satellites_used;
    target.pdop = static_cast<float>(pdop);
    target.hdop = static_cast<float>(hdop);
    target.vdop = static_cast<float>(vdop);

    if (target.fix_type > FixModel::kNoFix) {
        MarkFixTime(target);
    }
    return true;
}

bool NMEASentenceStream::DecodeGSV(const FieldList& fields, FixModel& target) {
    // $xxGSV,numMsg,msgNum,numSV,{prn,elev,azim,snr}x1..4*cs

    long num_sv_sentences, current_sv_sentence, satellites_in_view;
    if (!ParseUnsigned(fields.Get(1), UINT8_MAX, num_sv_sentences)) return false;
    if (!ParseUnsigned(fields.Get(2), UINT8_MAX, current_sv_sentence)) return false;
    if (!ParseUnsigned(fields.Get(3), UINT8_MAX, satellites_in_view)) return false;

    FixModel::SatelliteInfo blocks[kMaxSVBlocksPerGSV];
    uint8_t num_blocks = 0;
    for (uint8_t i = 0; i < kMaxSVBlocksPerGSV; i++) {
        size_t base = kGSVFirstBlockField + i * kGSVFieldsPerBlock;
        const char* prn_field = fields.Get(base);
        if (!prn_field || prn_field[0] == '\0') {
            break;
        }
        long prn;
        if (!ParseUnsigned(prn_field, UINT8_MAX, prn)) return false;

        FixModel::SatelliteInfo& info = blocks[num_blocks++];
        info.prn = static_cast<uint8_t>(prn);
        info.elevation_deg = ParseSatelliteField(fields.Get(base + 1));
        info.azimuth_deg = ParseSatelliteField(fields.Get(base + 2));
        info.snr_db = ParseSatelliteField(fields.Get(base + 3));
    }

    target.total_sv_sentences = static_cast<uint8_t>(num_sv_sentences);
    target.last_sv_sentence = static_cast<uint8_t>(current_sv_sentence);
    target.satellites_in_view = static_cast<uint8_t>(satellites_in_view);

    // The first sentence of a group starts a fresh table, later ones merge into it.
    if (current_sv_sentence == 1) {
        target.num_satellites = 0;
    }
    for (uint8_t i = 0; i < num_blocks; i++) {
        FixModel::SatelliteInfo* existing = nullptr;
        for (uint16_t j = 0; j < target.num_satellites; j++) {
            if (target.satellites[j].prn == blocks[i].prn) {
                existing = &target.satellites[j];
                break;
            }
        }
        if (existing) {
            *existing = blocks[i];
        } else if (target.num_satellites < FixModel::kMaxSatellites) {
            target.satellites[target.num_satellites++] = blocks[i];
        }
    }
    return true;
}

void NMEASentenceStream::MarkFixTime(FixModel& target) const {
    target.has_fix_time = true;
    target.last_fix_time_ms = GetTimeMs();
}

uint32_t NMEASentenceStream::GetTimeMs() const {
    if (config_.get_time_ms) {
        return config_.get_time_ms();
    }
    return GET_TIME_MS();
}

size_t NMEASentenceStream::GetDiagnostics(char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    int written = snprintf(buffer, max_len,
                           "NMEA Sentence Stream Diagnostics:\n"
                           "  Clean sentences: %" PRIu32
                           "\n"
                           "  Checksum errors: %" PRIu32
                           "\n"
                           "  Parsed sentences: %" PRIu32
                           "\n"
                           "  Satellites in use/view: %u/%u\n"
                           "  Fix: %s (%s)\n",
                           fix_.clean_sentences, fix_.crc_fails, fix_.parsed_sentences, fix_.satellites_in_use,
                           fix_.satellites_in_view, fix_.valid ? "Valid" : "Invalid", fix_.GetFixTypeString());

    return (written > 0 && written < static_cast<int>(max_len)) ? written : 0;
}
