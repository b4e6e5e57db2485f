#include "ChunkWorker.h"
#include "../io/PartFile.h"
#include "../io/Checksum.h"

#include <cstring>

namespace {
FetchError makeError(ErrorKind kind, const std::string& message) {
    FetchError err;
    err.kind = kind;
    err.message = message;
    return err;
}
}

ChunkWorker::ChunkWorker(const Job& j,
    PartQueue& queue,
    FetchClient& client,
    ConcurrencyBudget& b,
    ManifestStore& m,
    const ScratchArea& s,
    ProgressTracker& p,
    CancellationToken& t,
    ReportCallback cb)
    : job(j),
    partQueue(queue),
    fetchClient(client),
    budget(b),
    manifest(m),
    scratch(s),
    progress(p),
    token(t),
    report(std::move(cb)) {
}

void ChunkWorker::run() {
    while (!token.cancelled()) {

        auto partOpt = partQueue.next(token);
        if (!partOpt.has_value())
            return;

        const Part part = *partOpt;

        auto slot = budget.acquire(token);
        if (!slot.held()) {
            partQueue.release(part.index);
            return;
        }

        WorkerReport rep{};
        rep.partIndex = part.index;

        PartOutcome out;
        if (manifest.markInFlight(job.id, part.index))
            out = fetchPart(part);
        else
            out.error = makeError(ErrorKind::Fatal, "manifest write failed: " + manifest.lastError());

        slot.release();

        if (out.done) {
            // Durable in the manifest before anyone sees the part as Done.
            if (manifest.markDone(job.id, part.index, out.length, out.crc)) {
                partQueue.markDone(part.index, out.length, out.crc);
                rep.success = true;
                rep.bytesDownloaded = out.length;
            }
            else {
                out.error = makeError(ErrorKind::Fatal, "manifest write failed: " + manifest.lastError());
            }
        }

        if (!rep.success) {
            rep.error = out.error;

            if (out.error.kind == ErrorKind::Cancelled || token.cancelled()) {
                partQueue.release(part.index);
                rep.error.kind = ErrorKind::Cancelled;
                report(rep);
                return;
            }

            Part updated;
            rep.willRetry = partQueue.markFailed(part.index, out.error, updated);
            rep.attempts = updated.attempts;

            if (!manifest.markFailed(job.id, part.index, out.error.message, updated.attempts)) {
                rep.willRetry = false;
                rep.error = makeError(ErrorKind::Fatal, "manifest write failed: " + manifest.lastError());
            }
        }

        report(rep);
    }
}

PartOutcome ChunkWorker::fetchPart(const Part& part) {
    PartOutcome out;

    PartFile file(scratch.partPath(job.id, part.index));
    if (!file.open()) {
        out.error = makeError(ErrorKind::Fatal,
            "cannot open part file: " + std::string(std::strerror(file.lastErrno())));
        return out;
    }

    FetchError err;
    auto stream = fetchClient.openRangeStream(job.locator, part.offset, part.length, err);
    if (!stream) {
        if (err.kind == ErrorKind::None)
            err.kind = ErrorKind::Transient;
        out.error = err;
        return out;
    }

    // Physical disconnect: cancelling the token closes this transport.
    auto severance = token.attach([&stream]() { stream->close(); });

    Crc32 crc;
    bool writeFailed = false;
    bool overflow = false;

    bool ok = stream->read([&](const char* data, std::size_t size) {
        if (file.written() + size > part.length) {
            overflow = true;
            return false;
        }
        if (!file.write(data, size)) {
            writeFailed = true;
            return false;
        }
        crc.update(data, size);
        partQueue.addProgress(part.index, size);
        progress.add(size);
        return true;
        }, err);

    severance.reset();

    if (token.cancelled()) {
        out.error = makeError(ErrorKind::Cancelled, "cancelled");
        return out;
    }

    if (writeFailed) {
        out.error = makeError(ErrorKind::Fatal,
            "write failed: " + std::string(std::strerror(file.lastErrno())));
        return out;
    }

    if (overflow) {
        out.error = makeError(ErrorKind::Transient, "remote sent more than the requested range");
        return out;
    }

    if (!ok) {
        if (err.kind == ErrorKind::None)
            err.kind = ErrorKind::Transient;
        out.error = err;
        return out;
    }

    if (file.written() != part.length) {
        out.error = makeError(ErrorKind::Transient, "short read: " + std::to_string(file.written())
            + " of " + std::to_string(part.length) + " bytes");
        return out;
    }

    if (!file.sync()) {
        out.error = makeError(ErrorKind::Fatal,
            "sync failed: " + std::string(std::strerror(file.lastErrno())));
        return out;
    }
    file.close();

    out.done = true;
    out.length = part.length;
    out.crc = crc.value();
    return out;
}
