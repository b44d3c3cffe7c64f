#include "style.h"

#include <QFile>
#include <QJsonDocument>
#include <iostream>

namespace sevenseg {

bool parseSkew(const QString& text, Skew& skew) {
	const QString name = text.trimmed().toLower();
	if (name == "none") {
		skew = Skew::none();
		return true;
	} else if (name == "traditional") {
		skew = Skew::traditional();
		return true;
	}
	bool ok = false;
	const qreal factor = name.toDouble(&ok);
	if (ok) {
		skew = Skew::custom(factor);
	}
	return ok;
}

QString skewName(Skew skew) {
	if (skew.isNone()) {
		return "none";
	} else if (skew == Skew::traditional()) {
		return "traditional";
	}
	return QString::number(skew.factor);
}

static void readColor(const QJsonObject& json, const char* key, QColor& color) {
	if (!json.contains(key)) {
		return;
	}
	const QColor parsed(json[key].toString());
	if (!parsed.isValid()) {
		std::cerr << "[Style] Warning: '" << key << "' is not a valid color, keeping "
		          << color.name().toStdString() << std::endl;
		return;
	}
	color = parsed;
}

void Style::fromJSON(QJsonObject json) {
	readColor(json, "color", color);
	readColor(json, "background", background);

	if (json.contains("skew")) {
		const QJsonValue value = json.value("skew");
		if (value.isDouble()) {
			skew = Skew::custom(value.toDouble());
		} else if (!parseSkew(value.toString(), skew)) {
			std::cerr << "[Style] Warning: unknown skew '" << value.toString().toStdString() << "'" << std::endl;
		}
	}

	if (json.contains("aspect_ratio")) {
		const qreal ratio = json.value("aspect_ratio").toDouble(-1);
		if (ratio > 0) {
			aspect_ratio = ratio;
		} else {
			std::cerr << "[Style] Warning: aspect_ratio has to be a positive number" << std::endl;
		}
	}

	if (json.contains("height")) {
		const int h = json.value("height").toInt(-1);
		if (h > 0) {
			height = h;
		} else {
			std::cerr << "[Style] Warning: height has to be a positive integer" << std::endl;
		}
	}
}

QJsonObject Style::toJSON() const {
	QJsonObject json;
	json["color"] = color.name(QColor::HexArgb);
	json["background"] = background.name(QColor::HexArgb);
	if (skew.isNone() || skew == Skew::traditional()) {
		json["skew"] = skewName(skew);
	} else {
		json["skew"] = skew.factor;
	}
	json["aspect_ratio"] = aspect_ratio;
	json["height"] = (int)height;
	return json;
}

bool loadStyleFile(const QString& file, Style& style) {
	QFile styleFile(file);
	if (!styleFile.open(QIODevice::ReadOnly)) {
		std::cerr << "[Style] Could not open style file " << file.toStdString() << std::endl;
		return false;
	}

	QByteArray raw_file = styleFile.readAll();
	QJsonParseError error;
	QJsonDocument json_doc = QJsonDocument::fromJson(raw_file, &error);
	if (json_doc.isNull() || !json_doc.isObject()) {
		std::cerr << "[Style] Style file seems to be invalid: ";
		std::cerr << error.errorString().toStdString() << std::endl;
		return false;
	}
	style.fromJSON(json_doc.object());
	return true;
}

bool saveStyleFile(const QString& file, const Style& style) {
	QFile styleFile(file);
	if (!styleFile.open(QIODevice::WriteOnly)) {
		std::cerr << "[Style] Could not open " << file.toStdString() << " for writing" << std::endl;
		return false;
	}
	QJsonDocument json_doc(style.toJSON());
	if (styleFile.write(json_doc.toJson()) < 0) {
		std::cerr << "[Style] Could not write style file " << file.toStdString() << std::endl;
		return false;
	}
	return true;
}

}  // namespace sevenseg
