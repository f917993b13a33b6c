// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <ctime>
#include <exception>
#include <string>
#include <vector>
#include <strings.h>
#include <vmime/addressList.hpp>
#include <vmime/attachment.hpp>
#include <vmime/charset.hpp>
#include <vmime/contentHandler.hpp>
#include <vmime/datetime.hpp>
#include <vmime/exception.hpp>
#include <vmime/header.hpp>
#include <vmime/htmlTextPart.hpp>
#include <vmime/mailbox.hpp>
#include <vmime/mailboxGroup.hpp>
#include <vmime/message.hpp>
#include <vmime/messageParser.hpp>
#include <vmime/parsingContext.hpp>
#include <vmime/relay.hpp>
#include <vmime/text.hpp>
#include <vmime/textPart.hpp>
#include <vmime/utility/outputStreamStringAdapter.hpp>
#include <mailbridge/mime_parse.hpp>
#include <mailbridge/reply.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

static std::string mp_decode(const vmime::contentHandler &ch, const vmime::charset &cset)
{
	std::string raw;
	vmime::utility::outputStreamStringAdapter os(raw);
	ch.extract(os);
	os.flush();
	std::string out;
	try {
		vmime::charset::convert(raw, out, cset, vmime::charsets::UTF_8);
	} catch (const vmime::exception &e) {
		/* unknown charset: hand out the octets as they are */
		mlog(LV_DEBUG, "mime: charset \"%s\": %s", cset.getName().c_str(), e.what());
		return raw;
	}
	return out;
}

static std::string mp_date(const vmime::datetime &d)
{
	struct tm tm{};
	tm.tm_year = d.getYear() - 1900;
	tm.tm_mon  = d.getMonth() - 1;
	tm.tm_mday = d.getDay();
	tm.tm_hour = d.getHour();
	tm.tm_min  = d.getMinute();
	tm.tm_sec  = d.getSecond();
	auto t = timegm(&tm) - d.getZone() * 60;
	return iso8601_str(t, d.getZone());
}

static void mp_mailbox(const vmime::mailbox &mb, std::vector<address_pair> &out)
{
	if (mb.isEmpty())
		return;
	out.emplace_back(mb.getName().getConvertedText(vmime::charsets::UTF_8),
		mb.getEmail().toString());
}

static void mp_addrlist(const vmime::addressList &al, std::vector<address_pair> &out)
{
	for (size_t i = 0; i < al.getAddressCount(); ++i) {
		auto a = al.getAddressAt(i);
		if (a->isGroup()) {
			auto g = vmime::dynamicCast<const vmime::mailboxGroup>(a);
			if (g == nullptr)
				continue;
			for (size_t j = 0; j < g->getMailboxCount(); ++j)
				mp_mailbox(*g->getMailboxAt(j), out);
			continue;
		}
		auto mb = vmime::dynamicCast<const vmime::mailbox>(a);
		if (mb != nullptr)
			mp_mailbox(*mb, out);
	}
}

std::string mime_header_block(const std::string &raw)
{
	auto p = raw.find("\r\n\r\n");
	auto q = raw.find("\n\n");
	if (p == raw.npos && q == raw.npos)
		return raw;
	if (p == raw.npos || (q != raw.npos && q < p))
		return raw.substr(0, q + 1);
	return raw.substr(0, p + 2);
}

bool mime_parse(const std::string &raw, parsed_message &out,
    std::string &reason, std::vector<std::string> *payloads) try
{
	if (raw.empty()) {
		reason = "empty message";
		return false;
	}
	vmime::parsingContext vpctx;
	vpctx.setInternationalizedEmailSupport(true); /* RFC 6532 */
	auto msg = vmime::make_shared<vmime::message>();
	msg->parse(vpctx, raw);
	auto hdr = msg->getHeader();
	if (hdr->getFieldCount() == 0) {
		reason = "no header fields";
		return false;
	}
	vmime::messageParser mp(msg);

	out.subject = mp.getSubject().getConvertedText(vmime::charsets::UTF_8);
	out.from.clear();
	mp_mailbox(mp.getExpeditor(), out.from);
	out.to.clear();
	out.cc.clear();
	out.bcc.clear();
	mp_addrlist(mp.getRecipients(), out.to);
	mp_addrlist(mp.getCopyRecipients(), out.cc);
	mp_addrlist(mp.getBlindCopyRecipients(), out.bcc);
	if (hdr->hasField(vmime::fields::DATE))
		out.date = mp_date(mp.getDate());
	else
		out.date.reset();

	out.headers.clear();
	out.message_id.clear();
	out.in_reply_to.clear();
	for (const auto &hf : hdr->getFieldList()) {
		vmime::text txt;
		txt.parse(hf->getValue()->generate());
		auto value = txt.getConvertedText(vmime::charsets::UTF_8);
		const auto &name = hf->getName();
		if (strcasecmp(name.c_str(), "Message-ID") == 0)
			out.message_id = strtrim(value);
		else if (strcasecmp(name.c_str(), "In-Reply-To") == 0)
			out.in_reply_to = strtrim(value);
		out.headers.emplace_back(name, std::move(value));
	}

	out.received.clear();
	for (const auto &hf : hdr->findAllFields("Received")) {
		auto r = hf->getValue<vmime::relay>();
		if (r == nullptr)
			continue;
		received_hop hop;
		hop.from = r->getFrom();
		hop.by   = r->getBy();
		for (const auto &w : r->getWith()) {
			if (!hop.with.empty())
				hop.with += ' ';
			hop.with += w;
		}
		hop.id   = r->getId();
		hop.for_ = r->getFor();
		hop.date = mp_date(r->getDate());
		out.received.push_back(std::move(hop));
	}

	out.text_plain.clear();
	out.text_html.clear();
	for (size_t i = 0; i < mp.getTextPartCount(); ++i) {
		auto tp = mp.getTextPartAt(i);
		if (tp->getType().getSubType() != vmime::mediaTypes::TEXT_HTML) {
			out.text_plain.push_back(mp_decode(*tp->getText(), tp->getCharset()));
			continue;
		}
		out.text_html.push_back(mp_decode(*tp->getText(), tp->getCharset()));
		auto hp = vmime::dynamicCast<const vmime::htmlTextPart>(tp);
		if (hp != nullptr && hp->getPlainText() != nullptr &&
		    hp->getPlainText()->getLength() > 0)
			out.text_plain.push_back(mp_decode(*hp->getPlainText(), tp->getCharset()));
	}

	out.attachments.clear();
	if (payloads != nullptr)
		payloads->clear();
	for (size_t i = 0; i < mp.getAttachmentCount(); ++i) {
		auto at = mp.getAttachmentAt(i);
		attachment_info ai;
		ai.filename = at->getName().getConvertedText(vmime::charsets::UTF_8);
		ai.content_type = at->getType().generate();
		std::string data;
		vmime::utility::outputStreamStringAdapter os(data);
		at->getData()->extract(os);
		os.flush();
		ai.size = data.size();
		auto ah = at->getHeader();
		if (ah != nullptr && ah->hasField(vmime::fields::CONTENT_ID))
			ai.content_id = clean_message_id(ah->findField(vmime::fields::CONTENT_ID)->getValue()->generate());
		out.attachments.push_back(std::move(ai));
		if (payloads != nullptr)
			payloads->push_back(std::move(data));
	}
	return true;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1502: ENOMEM");
	reason = "out of memory";
	return false;
} catch (const std::exception &e) {
	reason = e.what();
	return false;
}

}
