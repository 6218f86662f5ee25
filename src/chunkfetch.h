#ifndef CHUNKFETCH_H
#define CHUNKFETCH_H

#include "upstream.h"
#include "aevutil.h"

namespace sgate
{

/**
 * Chunk-aligned read plan for the byte range [from, until].
 * Parts are numbered from 1, part k starts at alignedOffset + (k-1) * chunkSize.
 */
struct SGATE_API tChunkPlan
{
	off_t from = 0, until = 0;
	unsigned chunkSize = 0;
	off_t alignedOffset = 0;
	// bytes to skip in the first part
	unsigned firstCut = 0;
	// end (exclusive) of the useful bytes in the last part
	unsigned lastCut = 0;
	off_t partCount = 0;

	static tChunkPlan Make(off_t from, off_t until, unsigned chunkSize);
	off_t GetPartOffset(off_t part) const { return alignedOffset + (part - 1) * chunkSize; }
	off_t GetLength() const { return until - from + 1; }
};

/**
 * Pulls the chunks of a plan one by one through an upstream session and cuts them to the requested range.
 *
 * The slices form a sequence which cannot be restarted. A failed read can be repeated by calling Next again,
 * optionally after moving the fetcher to another session.
 */
class SGATE_API chunkfetcher
{
public:
	/**
	 * @param slice Trimmed bytes, the receiver may drain them. Empty slice with good status means end of data.
	 * nullptr on errors.
	 */
	using tSliceResult = std::function<void(const tUpstreamStatus&, evbuffer* slice)>;

	/**
	 * @param wholeFile The range covers the complete file, the remote decides where the data ends
	 */
	chunkfetcher(lint_ptr<IUpstreamSession> session, const tRemoteFile& file,
				 off_t from, off_t until, unsigned chunkSize, bool wholeFile = false);
	~chunkfetcher();

	/**
	 * Requests the next part. Only one request can be active.
	 */
	void Next(tSliceResult cb);
	// continue with the same plan on another session, the active read is dropped
	void Rebind(lint_ptr<IUpstreamSession> session, const tRemoteFile& file);
	void Cancel();

	bool AtEnd() const { return m_bEof || m_nCurrentPart > m_plan.partCount; }
	bool IsBusy() const { return bool(m_pending); }
	off_t GetYielded() const { return m_nYielded; }
	// absolute offset of the first byte which was not delivered yet
	off_t GetNextOffset() const { return m_plan.from + m_nYielded; }
	const tChunkPlan& GetPlan() const { return m_plan; }

	SUTPRIVATE:
	lint_ptr<IUpstreamSession> m_session;
	tRemoteFile m_file;
	tChunkPlan m_plan;
	bool m_bWholeFile;
	off_t m_nCurrentPart = 1;
	off_t m_nYielded = 0;
	bool m_bEof = false;
	TFinalAction m_pending;
	unique_eb m_slice;

	void onChunk(const tUpstreamStatus&, evbuffer* data, const tSliceResult& cb);
};

}

#endif // CHUNKFETCH_H
