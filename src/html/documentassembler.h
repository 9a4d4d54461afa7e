/*
 * documentassembler.h: HTML fragment -> self-contained printable document
 *
 * The stylesheet is fixed policy; only the page margin is substituted.
 * Nothing in the output refers to an external resource, so the renderer
 * never needs network access.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_DOCUMENTASSEMBLER_H
#define MD2PDF_DOCUMENTASSEMBLER_H

#include <QString>

#include "renderconfig.h"

class AssembledDocument
{
public:
    AssembledDocument() = default;
    AssembledDocument(const QString &htmlBody, const QString &cssTemplate,
                      const QString &title)
        : m_htmlBody(htmlBody)
        , m_cssTemplate(cssTemplate)
        , m_title(title)
    {
    }

    const QString &htmlBody() const { return m_htmlBody; }
    const QString &cssTemplate() const { return m_cssTemplate; }
    const QString &title() const { return m_title; }

    // The complete HTML document handed to the renderer
    QString toHtml() const;

    bool operator==(const AssembledDocument &other) const
    {
        return m_htmlBody == other.m_htmlBody
            && m_cssTemplate == other.m_cssTemplate
            && m_title == other.m_title;
    }
    bool operator!=(const AssembledDocument &other) const { return !(*this == other); }

private:
    QString m_htmlBody;
    QString m_cssTemplate;
    QString m_title;
};

class DocumentAssembler
{
public:
    static AssembledDocument assemble(const QString &htmlBody, const RenderConfig &config);

    // The stylesheet with marginPixels substituted into the @page rule
    static QString stylesheet(int marginPixels);

    // Text of the first heading in htmlBody, or "Document"
    static QString documentTitle(const QString &htmlBody);
};

#endif // MD2PDF_DOCUMENTASSEMBLER_H
