#include "chunkfetch.h"
#include "evabase.h"
#include "sgstrop.h"
#include "debug.h"

#include <memory>

using namespace std;

namespace sgate
{

tChunkPlan tChunkPlan::Make(off_t from, off_t until, unsigned chunkSize)
{
	tChunkPlan ret;
	ret.from = from;
	ret.until = until;
	ret.chunkSize = chunkSize;
	ret.alignedOffset = from - (from % chunkSize);
	ret.firstCut = unsigned(from - ret.alignedOffset);
	ret.lastCut = unsigned(until % chunkSize) + 1;
	ret.partCount = (until + chunkSize) / chunkSize - ret.alignedOffset / chunkSize;
	return ret;
}

chunkfetcher::chunkfetcher(lint_ptr<IUpstreamSession> session, const tRemoteFile& file,
						   off_t from, off_t until, unsigned chunkSize, bool wholeFile)
	: m_session(move(session)), m_file(file),
	  m_plan(tChunkPlan::Make(from, until, chunkSize)),
	  m_bWholeFile(wholeFile),
	  m_slice(evbuffer_new())
{
	if (!*m_slice)
		throw std::bad_alloc();
}

chunkfetcher::~chunkfetcher()
{
	Cancel();
}

void chunkfetcher::Cancel()
{
	m_pending.reset();
}

void chunkfetcher::Rebind(lint_ptr<IUpstreamSession> session, const tRemoteFile& file)
{
	Cancel();
	m_session = move(session);
	m_file = file;
}

void chunkfetcher::Next(tSliceResult cb)
{
	ASSERT(!m_pending);
	if (AtEnd())
	{
		evbuffer_drain(*m_slice, evbuffer_get_length(*m_slice));
		auto alive = make_shared<bool>(true);
		m_pending = TFinalAction([alive]() { *alive = false; });
		return evabase::Post([this, alive, cb]()
		{
			if (!*alive)
				return;
			m_pending.release();
			cb(tUpstreamStatus(), *m_slice);
		});
	}
	auto offset = m_plan.GetPartOffset(m_nCurrentPart);
	LOG("reading part " << m_nCurrentPart << "/" << m_plan.partCount << " at " << offset);
	m_pending = m_session->ReadChunk(m_file, offset, m_plan.chunkSize,
									 [this, cb](const tUpstreamStatus& st, evbuffer* data)
	{
		onChunk(st, data, cb);
	});
}

void chunkfetcher::onChunk(const tUpstreamStatus& st, evbuffer* data, const tSliceResult& cb)
{
	// the read is over, nothing to cancel anymore
	m_pending.release();
	if (!st.ok())
		return cb(st, nullptr);

	auto slice = *m_slice;
	evbuffer_drain(slice, evbuffer_get_length(slice));

	size_t got = data ? evbuffer_get_length(data) : 0;
	if (got == 0)
	{
		m_bEof = true;
		return cb(st, slice);
	}
	if (got > m_plan.chunkSize)
		return cb(tUpstreamStatus(EUpstreamError::BAD_ALIGNMENT, "remote sent more than requested"), nullptr);

	size_t begin = 0, end = got;
	bool first = m_nCurrentPart == 1, last = m_nCurrentPart == m_plan.partCount;
	if (first)
		begin = m_plan.firstCut;
	if (last && !m_bWholeFile && end > m_plan.lastCut)
		end = m_plan.lastCut;
	// a short chunk is the end of the file
	if (got < m_plan.chunkSize)
		m_bEof = true;

	m_nCurrentPart++;
	if (begin >= end)
	{
		m_bEof = true;
		return cb(st, slice);
	}
	if (begin)
		evbuffer_drain(data, begin);
	if (eb_move_range(data, slice, end - begin) < 0)
		return cb(tUpstreamStatus(EUpstreamError::TRANSIENT, "out of memory"), nullptr);

	m_nYielded += end - begin;
	cb(st, slice);
}

}
