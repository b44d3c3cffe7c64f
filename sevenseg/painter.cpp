#include "painter.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace sevenseg {

constexpr bool debug_logging = false;

void paint(QPainter& p, const Fills& fills) {
	p.save();
	p.setRenderHint(QPainter::Antialiasing);
	p.setPen(Qt::NoPen);
	for (const SegmentFill& fill : fills) {
		p.fillPath(fill.shape, fill.color);
	}
	p.restore();
}

QSize imageSize(const Readout& readout, const Style& style) {
	const int width = std::lround(style.height * readout.aspectRatio(style.aspect_ratio));
	return QSize(std::max(1, width), std::max<int>(1, style.height));
}

QImage renderImage(const Readout& readout, const Style& style) {
	QImage image(imageSize(readout, style), QImage::Format_ARGB32_Premultiplied);
	image.fill(style.background);

	if (debug_logging)
		std::cout << "[Painter] rendering " << readout.size() << " displays into " << image.width() << "x"
		          << image.height() << std::endl;

	QPainter p(&image);
	paint(p, readout.render(QRectF(image.rect())));
	p.end();
	return image;
}

}  // namespace sevenseg
