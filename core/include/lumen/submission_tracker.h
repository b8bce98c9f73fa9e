#pragma once

/**
 * @file submission_tracker.h
 * @brief Submission ids and completion for a device that can be recreated
 *
 * Ids keep increasing across device recreation. Completion reports for ids
 * issued before the current device existed belong to a released queue and
 * are ignored, whatever their status.
 */

#include <lumen/device.h>

namespace lumen {

class SubmissionTracker {
public:
    /// Id for the next submission on the current device
    SubmissionId next() { return ++m_submitted; }

    /// Work-done report. A failed report for a current id marks the device lost.
    void complete(SubmissionId id, bool success) {
        if (id < m_firstOfDevice) return;
        if (!success) m_lost = true;
        if (id > m_completed) m_completed = id;
    }

    /// A new device replaced the old one; everything issued so far counts as done
    void resetForNewDevice() {
        m_completed = m_submitted;
        m_firstOfDevice = m_submitted + 1;
        m_lost = false;
    }

    void markLost() { m_lost = true; }

    SubmissionId submitted() const { return m_submitted; }
    SubmissionId completed() const { return m_completed; }
    bool lost() const { return m_lost; }

private:
    SubmissionId m_submitted = 0;
    SubmissionId m_completed = 0;
    SubmissionId m_firstOfDevice = 1;
    bool m_lost = false;
};

} // namespace lumen
