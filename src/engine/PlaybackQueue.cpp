// SPDX-License-Identifier: Apache-2.0
#include "PlaybackQueue.hpp"

#include <core/Log.hpp>

namespace voicetutor
{

PlaybackQueue::PlaybackQueue(AudioSink& sink, DrainPoster postDrained, PlaybackCallbacks callbacks):
    _sink(sink), _postDrained(std::move(postDrained)), _callbacks(std::move(callbacks))
{
}

auto PlaybackQueue::enqueue(std::string sourceText, AudioClip clip, GenerationToken token, std::string writtenText)
    -> std::uint64_t
{
    auto const id = ++_nextSegmentId;
    _queue.push_back(TtsSegment {
        .id = id,
        .token = token,
        .sourceText = std::move(sourceText),
        .writtenText = std::move(writtenText),
        .clip = std::move(clip),
    });
    log::trace("Playback: segment {} queued ({} ms)", id, _queue.back().clip.duration().count());

    if (!_current)
        startNext();
    return id;
}

void PlaybackQueue::startNext()
{
    while (!_current && !_queue.empty())
    {
        auto segment = std::move(_queue.front());
        _queue.pop_front();
        segment.state = SegmentState::Playing;
        _current = std::move(segment);

        auto const id = _current->id;
        auto played = _sink.play(_current->clip, [post = _postDrained, id] {
            if (post)
                post(id);
        });

        if (!played)
        {
            log::error("Playback of segment {} failed: {}", id, played.error());
            auto failed = std::move(*_current);
            _current.reset();
            end(std::move(failed), SegmentState::Aborted);
            continue;
        }

        log::debug("Playback: segment {} started", id);
        if (_callbacks.onStarted)
            _callbacks.onStarted(*_current);
    }

    if (!_current && _queue.empty() && _callbacks.onIdle)
        _callbacks.onIdle();
}

void PlaybackQueue::end(TtsSegment segment, SegmentState state)
{
    segment.state = state;
    log::trace("Playback: segment {} {}", segment.id, segmentStateName(state));
    if (_callbacks.onEnded)
        _callbacks.onEnded(segment);
}

auto PlaybackQueue::flush() -> std::size_t
{
    if (!_current && _queue.empty())
        return 0;

    if (_current)
        _sink.stop();

    auto aborted = std::size_t { 0 };
    if (_current)
    {
        auto playing = std::move(*_current);
        _current.reset();
        end(std::move(playing), SegmentState::Aborted);
        ++aborted;
    }

    auto pending = std::move(_queue);
    _queue.clear();
    for (auto& segment: pending)
    {
        end(std::move(segment), SegmentState::Aborted);
        ++aborted;
    }

    log::debug("Playback flushed, {} segment(s) aborted", aborted);
    return aborted;
}

void PlaybackQueue::onSinkDrained(std::uint64_t segmentId)
{
    if (!_current || _current->id != segmentId)
    {
        log::trace("Playback: ignoring drain of segment {}", segmentId);
        return;
    }

    auto finished = std::move(*_current);
    _current.reset();
    end(std::move(finished), SegmentState::Finished);
    startNext();
}

void PlaybackQueue::release()
{
    (void) flush();
    _sink.release();
}

} // namespace voicetutor
