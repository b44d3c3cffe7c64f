#include "readout_view.h"

#include <QPainter>

#include "sevenseg/painter.h"

using namespace sevenseg;

ReadoutView::ReadoutView(const Style& style, const QString& text, QWidget* parent)
    : QWidget(parent), readout_style(style), readout(Readout::resembling(text, style.color, style.skew)) {
	setAutoFillBackground(true);
	QPalette pal = palette();
	pal.setColor(QPalette::Window, readout_style.background);
	setPalette(pal);
	updateMinimumSize();
}

ReadoutView::~ReadoutView() {}

QSize ReadoutView::sizeHint() const {
	return imageSize(readout, readout_style);
}

const Readout& ReadoutView::getReadout() const {
	return readout;
}

const Style& ReadoutView::getReadoutStyle() const {
	return readout_style;
}

void ReadoutView::setText(const QString& text) {
	readout = Readout::resembling(text, readout_style.color, readout_style.skew);
	updateMinimumSize();
	update();
}

void ReadoutView::setReadoutStyle(const Style& style) {
	readout_style = style;
	readout = Readout(readout.states(), style.color, style.skew);
	QPalette pal = palette();
	pal.setColor(QPalette::Window, readout_style.background);
	setPalette(pal);
	updateMinimumSize();
	update();
}

// a quarter of the natural size, follows the character count and height
void ReadoutView::updateMinimumSize() {
	setMinimumSize(imageSize(readout, readout_style) / 4);
	updateGeometry();
}

/* QT */

void ReadoutView::paintEvent(QPaintEvent*) {
	// keep the aspect ratio and center the readout in the widget
	const qreal ratio = readout.aspectRatio(readout_style.aspect_ratio);
	QSizeF size(width(), width() / ratio);
	if (size.height() > height()) {
		size = QSizeF(height() * ratio, height());
	}
	QRectF frame(QPointF(0, 0), size);
	frame.moveCenter(QRectF(rect()).center());

	QPainter p(this);
	paint(p, readout.render(frame));
}
