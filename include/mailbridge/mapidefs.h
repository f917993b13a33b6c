#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <mailbridge/defs.h>

#define PROP_ID(x) ((x) >> 16)
#define PROP_TYPE(x) ((x) & 0xFFFF)
#define PROP_TAG(type, tag) ((((unsigned int)(tag)) << 16) | (type))
#define CHANGE_PROP_TYPE(tag, newtype) (((tag) & ~0xFFFF) | (newtype))

enum {
	PT_UNSPECIFIED = 0x0000,
	PT_NULL = 0x0001,
	PT_LONG = 0x0003,
	PT_DOUBLE = 0x0005,
	PT_ERROR = 0x000A,
	PT_BOOLEAN = 0x000B,
	PT_I8 = 0x0014,
	PT_UNICODE = 0x001F,
	PT_SYSTIME = 0x0040,
	PT_BINARY = 0x0102,
};

enum {
	PR_IMPORTANCE = PROP_TAG(PT_LONG, 0x0017), /* PidTagImportance */
	PR_MESSAGE_CLASS = PROP_TAG(PT_UNICODE, 0x001A), /* PidTagMessageClass */
	PR_SUBJECT = PROP_TAG(PT_UNICODE, 0x0037), /* PidTagSubject */
	PR_CLIENT_SUBMIT_TIME = PROP_TAG(PT_SYSTIME, 0x0039), /* PidTagClientSubmitTime */
	PR_SENT_REPRESENTING_NAME = PROP_TAG(PT_UNICODE, 0x0042), /* PidTagSentRepresentingName */
	PR_RESPONSE_REQUESTED = PROP_TAG(PT_BOOLEAN, 0x0063), /* PidTagResponseRequested */
	PR_TRANSPORT_MESSAGE_HEADERS = PROP_TAG(PT_UNICODE, 0x007D), /* PidTagTransportMessageHeaders */
	PR_SENDER_NAME = PROP_TAG(PT_UNICODE, 0x0C1A), /* PidTagSenderName */
	PR_SENDER_EMAIL_ADDRESS = PROP_TAG(PT_UNICODE, 0x0C1F), /* PidTagSenderEmailAddress */
	PR_DISPLAY_BCC = PROP_TAG(PT_UNICODE, 0x0E02), /* PidTagDisplayBcc */
	PR_DISPLAY_CC = PROP_TAG(PT_UNICODE, 0x0E03), /* PidTagDisplayCc */
	PR_DISPLAY_TO = PROP_TAG(PT_UNICODE, 0x0E04), /* PidTagDisplayTo */
	PR_MESSAGE_DELIVERY_TIME = PROP_TAG(PT_SYSTIME, 0x0E06), /* PidTagMessageDeliveryTime */
	PR_MESSAGE_FLAGS = PROP_TAG(PT_LONG, 0x0E07), /* PidTagMessageFlags */
	PR_MESSAGE_SIZE = PROP_TAG(PT_LONG, 0x0E08), /* PidTagMessageSize */
	PR_PARENT_ENTRYID = PROP_TAG(PT_BINARY, 0x0E09), /* PidTagParentEntryId */
	PR_HASATTACH = PROP_TAG(PT_BOOLEAN, 0x0E1B), /* PidTagHasAttachments */
	PR_ATTACH_SIZE = PROP_TAG(PT_LONG, 0x0E20), /* PidTagAttachSize */
	PR_ATTACH_NUM = PROP_TAG(PT_LONG, 0x0E21), /* PidTagAttachNumber */
	PR_ENTRYID = PROP_TAG(PT_BINARY, 0x0FFF), /* PidTagEntryId */
	PR_BODY = PROP_TAG(PT_UNICODE, 0x1000), /* PidTagBody */
	PR_HTML = PROP_TAG(PT_BINARY, 0x1013), /* PidTagHtml */
	PR_INTERNET_MESSAGE_ID = PROP_TAG(PT_UNICODE, 0x1035), /* PidTagInternetMessageId */
	PR_INTERNET_REFERENCES = PROP_TAG(PT_UNICODE, 0x1039), /* PidTagInternetReferences */
	PR_IN_REPLY_TO_ID = PROP_TAG(PT_UNICODE, 0x1042), /* PidTagInReplyToId */
	PR_DISPLAY_NAME = PROP_TAG(PT_UNICODE, 0x3001), /* PidTagDisplayName */
	PR_DEPTH = PROP_TAG(PT_LONG, 0x3005), /* PidTagDepth */
	PR_CONTENT_COUNT = PROP_TAG(PT_LONG, 0x3602), /* PidTagContentCount */
	PR_ATTACH_DATA_BIN = PROP_TAG(PT_BINARY, 0x3701), /* PidTagAttachDataBinary */
	PR_ATTACH_LONG_FILENAME = PROP_TAG(PT_UNICODE, 0x3707), /* PidTagAttachLongFilename */
	PR_ATTACH_MIME_TAG = PROP_TAG(PT_UNICODE, 0x370E), /* PidTagAttachMimeTag */
	PR_ATTACH_CONTENT_ID = PROP_TAG(PT_UNICODE, 0x3712), /* PidTagAttachContentId */
};

enum {
	MSGFLAG_READ = 0x1U,
	MSGFLAG_UNMODIFIED = 0x2U,
	MSGFLAG_SUBMITTED = 0x4U,
	MSGFLAG_UNSENT = 0x8U,
	MSGFLAG_HASATTACH = 0x10U,
	MSGFLAG_FROMME = 0x20U,
};

/* MS-OXOCAL §2.2.1.10 PidLidAppointmentStateFlags */
enum {
	asfMeeting = 0x1U,
	asfReceived = 0x2U,
	asfCanceled = 0x4U,
};

/* MS-OXOCAL §2.2.1.11 PidLidResponseStatus */
enum {
	respNone = 0,
	respOrganized = 1,
	respTentative = 2,
	respAccepted = 3,
	respDeclined = 4,
	respNotResponded = 5,
};

enum {
	MNID_ID = 0,
	MNID_STRING = 1,
};

#define PSETID_Appointment "00062002-0000-0000-c000-000000000046"
#define PSETID_Task "00062003-0000-0000-c000-000000000046"
#define PSETID_Common "00062008-0000-0000-c000-000000000046"

enum {
	/* PSETID_Task */
	PidLidTaskStatus = 0x8101,
	PidLidPercentComplete = 0x8102,
	PidLidTaskDueDate = 0x8105,
	PidLidTaskComplete = 0x811C,
	/* PSETID_Appointment */
	PidLidBusyStatus = 0x8205,
	PidLidLocation = 0x8208,
	PidLidAppointmentStartWhole = 0x820D,
	PidLidAppointmentEndWhole = 0x820E,
	PidLidAppointmentSubType = 0x8215,
	PidLidAppointmentStateFlags = 0x8217,
	PidLidResponseStatus = 0x8218,
	PidLidRecurring = 0x8223,
	PidLidClipEnd = 0x8236,
	PidLidToAttendeesString = 0x823B,
	PidLidCcAttendeesString = 0x823C,
};

enum relop {
	RELOP_LT = 0x00,
	RELOP_LE,
	RELOP_GT,
	RELOP_GE,
	RELOP_EQ,
	RELOP_NE,
};

enum bm_relop {
	BMR_EQZ = 0,
	BMR_NEZ,
};

enum res_type {
	RES_AND = 0x00,
	RES_OR = 0x01,
	RES_NOT = 0x02,
	RES_CONTENT = 0x03,
	RES_PROPERTY = 0x04,
	RES_BITMASK = 0x06,
	RES_EXIST = 0x08,
	RES_NULL = 0xff,
};

enum {
	FL_FULLSTRING = 0,
	FL_SUBSTRING,
	FL_PREFIX,

	FL_IGNORECASE         = 1U << 16,
};

enum {
	TABLE_SORT_ASCEND = 0x0,
	TABLE_SORT_DESCEND = 0x1,
};

struct BINARY {
	std::string pv;

	inline size_t cb() const { return pv.size(); }
	bool operator==(const BINARY &o) const { return pv == o.pv; }
};

/*
 * PT_LONG: uint32_t; PT_BOOLEAN: uint8_t; PT_I8, PT_SYSTIME: uint64_t;
 * PT_DOUBLE: double; PT_UNICODE: std::string; PT_BINARY: BINARY;
 * PT_ERROR: uint32_t (an ec_error_t).
 */
using propval_t = std::variant<std::monostate, uint8_t, uint32_t, uint64_t,
      double, std::string, BINARY>;

struct MB_EXPORT TAGGED_PROPVAL {
	TAGGED_PROPVAL() = default;
	TAGGED_PROPVAL(uint32_t t, propval_t &&v) : proptag(t), value(std::move(v)) {}
	TAGGED_PROPVAL(uint32_t t, const propval_t &v) : proptag(t), value(v) {}

	uint32_t proptag = 0;
	propval_t value;

	std::string repr() const;
};

struct MB_EXPORT PROPERTY_NAME {
	uint8_t kind = MNID_ID;
	std::string guid;
	uint32_t lid = 0;
	std::string name;
};

using PROPTAG_ARRAY = std::vector<uint32_t>;

struct MB_EXPORT TPROPVAL_ARRAY {
	const TAGGED_PROPVAL *find(uint32_t tag) const {
		for (const auto &p : ppropval)
			if (p.proptag == tag)
				return &p;
		return nullptr;
	}
	inline bool has(uint32_t tag) const { return find(tag) != nullptr; }
	template<typename T> inline const T *get(uint32_t tag) const {
		auto v = find(tag);
		return v != nullptr ? std::get_if<T>(&v->value) : nullptr;
	}
	/*
	 * Typed-default accessor: the value if the column was read, @deflt if
	 * the column is absent. Faults are not distinguished; use fault()
	 * for that.
	 */
	template<typename T> inline T get_or(uint32_t tag, T deflt) const {
		auto v = get<T>(tag);
		return v != nullptr ? *v : deflt;
	}
	ec_error_t error_of(uint32_t tag) const;
	bool fault(uint32_t tag) const;
	void set(uint32_t tag, propval_t &&);
	void erase(uint32_t tag);
	inline size_t count() const { return ppropval.size(); }

	std::vector<TAGGED_PROPVAL> ppropval;
};

using TARRAY_SET = std::vector<TPROPVAL_ARRAY>;

struct SORT_ORDER {
	uint32_t proptag = 0;
	uint8_t table_sort = TABLE_SORT_ASCEND;
};

using SORTORDER_SET = std::vector<SORT_ORDER>;

struct MB_EXPORT RESTRICTION {
	res_type rt = RES_NULL;
	enum relop relop = RELOP_EQ;
	enum bm_relop bitmask_relop = BMR_EQZ;
	uint32_t proptag = 0;
	/* RES_CONTENT: FL_* flags; RES_BITMASK: the mask */
	uint32_t fuzzy_level = 0, mask = 0;
	TAGGED_PROPVAL propval;
	std::vector<RESTRICTION> sub;

	std::string repr() const;
	bool eval(const TPROPVAL_ARRAY &) const;

	static RESTRICTION make_prop(enum relop, uint32_t tag, propval_t &&);
	static RESTRICTION make_content(uint32_t fuzzy, uint32_t tag, std::string &&);
	static RESTRICTION make_bitmask(enum bm_relop, uint32_t tag, uint32_t mask);
	static RESTRICTION make_exist(uint32_t tag);
	static RESTRICTION make_not(RESTRICTION &&);
	static RESTRICTION make_and(std::vector<RESTRICTION> &&);
	static RESTRICTION make_or(std::vector<RESTRICTION> &&);
};

extern MB_EXPORT int propval_compare(const propval_t &, const propval_t &);
extern MB_EXPORT bool propval_compare_relop(enum relop, const propval_t &, const propval_t &);
extern MB_EXPORT const char *relop_repr(enum relop);
extern MB_EXPORT bool restriction_upper_bound(const RESTRICTION &, uint32_t tag, uint64_t &bound);
extern MB_EXPORT bool restriction_lower_bound(const RESTRICTION &, uint32_t tag, uint64_t &bound);
extern MB_EXPORT bool restriction_lower_bound(const RESTRICTION &, const PROPTAG_ARRAY &tags, uint64_t &bound);
