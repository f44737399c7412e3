/*
 * fixresult.h — Outcome of one autofix pass
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RAZORLINT_FIXRESULT_H
#define RAZORLINT_FIXRESULT_H

#include <QString>
#include <QStringList>

struct FixResult {
    QString text;          // corrected document (the input itself when unchanged)
    bool changed = false;
    QStringList actions;   // what was done, for --diagnose output
};

#endif // RAZORLINT_FIXRESULT_H
