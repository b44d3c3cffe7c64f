#pragma once

#include <QPaintEvent>
#include <QWidget>

#include "sevenseg/readout.h"
#include "sevenseg/style.h"

class ReadoutView : public QWidget {
	Q_OBJECT

	sevenseg::Style readout_style;
	sevenseg::Readout readout;

	void updateMinimumSize();
	void paintEvent(QPaintEvent*) override;

   public:
	ReadoutView(const sevenseg::Style& style, const QString& text = QString(), QWidget* parent = 0);
	~ReadoutView();

	QSize sizeHint() const override;
	const sevenseg::Readout& getReadout() const;
	const sevenseg::Style& getReadoutStyle() const;

   public slots:
	void setText(const QString& text);
	void setReadoutStyle(const sevenseg::Style& style);
};
